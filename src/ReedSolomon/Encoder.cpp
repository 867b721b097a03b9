#include <ReedSolomon/Encoder.hpp>

#include <stdexcept>
#include <vector>

namespace reedsolomon {

tools::BitVector Encoder::encode(const tools::BitVector& data, size_t numEcCodewords) {
  if ((data.size() % 8U) != 0U) {
    throw std::invalid_argument("Reed-Solomon: data block is not byte aligned");
  }

  // 1. Data block as polynomial shifted by x^n
  const auto dataPoly{GfPoly::multiply(GfPoly::fromData(data), GfPoly::monomial(GaloisField::ONE, numEcCodewords))};

  // 2. Error correction codewords are the remainder against the generator
  const auto remainder{GfPoly::remainder(dataPoly, generatorPolynomial(numEcCodewords))};

  // 3. Data block copied as is (leading zero bytes kept) followed by the remainder
  tools::BitVector result{data};
  result.appendBytes(remainder.data(numEcCodewords));

  return result;
}

GfPoly Encoder::generatorPolynomial(size_t degree) {
  if (degree < MIN_EC_CODEWORDS) {
    throw std::invalid_argument("Reed-Solomon: generator polynomial degree below 2");
  }

  GfPoly generator{std::vector<GfElement>{GaloisField::ONE}};
  for (size_t rootNo{0U}; rootNo < degree; rootNo++) {
    const GfPoly factor{std::vector<GfElement>{GaloisField::exp(static_cast<uint16_t>(rootNo)), GaloisField::ONE}};
    generator = GfPoly::multiply(generator, factor);
  }

  return generator;
}

}  // namespace reedsolomon
