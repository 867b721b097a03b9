#include <Tools/BitVector.hpp>

#include <stdexcept>

namespace tools {

BitVector::BitVector(std::initializer_list<bool> bits) {
  appendBools(bits);
}

BitVector BitVector::fromBase2String(const std::string& text) {
  BitVector result{};

  for (const auto character : text) {
    if (character == '0') {
      result.appendBit(false);
    } else if (character == '1') {
      result.appendBit(true);
    }
  }

  return result;
}

void BitVector::appendBit(bool value) {
  ensureCapacity(_numBits + 1U);

  if (value) {
    _bytes[_numBits / 8U] |= static_cast<uint8_t>(0x80 >> (_numBits % 8U));
  }

  _numBits++;
}

void BitVector::appendBools(std::initializer_list<bool> bits) {
  for (const auto bit : bits) {
    appendBit(bit);
  }
}

void BitVector::appendNumBools(size_t count, bool value) {
  for (size_t bitNo{0U}; bitNo < count; bitNo++) {
    appendBit(value);
  }
}

void BitVector::appendByte(uint8_t value, uint8_t numBits) {
  if (numBits > 8U) {
    throw std::invalid_argument("BitVector: more than 8 bits requested from a byte");
  }

  for (auto bitNo{numBits}; bitNo > 0U; --bitNo) {
    appendBit(((value >> (bitNo - 1U)) & 0x01) ? true : false);
  }
}

void BitVector::appendUint32(uint32_t value, uint8_t numBits) {
  if (numBits > 32U) {
    throw std::invalid_argument("BitVector: more than 32 bits requested from a 32 bit value");
  }

  for (auto bitNo{numBits}; bitNo > 0U; --bitNo) {
    appendBit(((value >> (bitNo - 1U)) & 0x01U) ? true : false);
  }
}

void BitVector::appendBytes(const std::vector<uint8_t>& bytes) {
  for (const auto byte : bytes) {
    appendByte(byte, 8U);
  }
}

void BitVector::append(const BitVector& other) {
  // other may be *this - take the size up front
  const auto bitsToCopy{other.size()};

  for (size_t bitNo{0U}; bitNo < bitsToCopy; bitNo++) {
    appendBit(other.at(bitNo));
  }
}

bool BitVector::at(size_t index) const {
  if (index >= _numBits) {
    throw std::out_of_range("BitVector: bit index out of range");
  }

  return (_bytes[index / 8U] & static_cast<uint8_t>(0x80 >> (index % 8U))) ? true : false;
}

uint8_t BitVector::byteAt(size_t index) const {
  if (index >= _numBits) {
    throw std::out_of_range("BitVector: byte index out of range");
  }

  uint8_t result{0U};
  for (auto bitIndex{index}; (bitIndex < index + 8U) and (bitIndex < _numBits); bitIndex++) {
    result = static_cast<uint8_t>(result << 1U);
    result |= (at(bitIndex) ? 0x01 : 0x00);
  }

  return result;
}

BitVector BitVector::substr(size_t start, size_t end) const {
  if ((start > end) or (end > _numBits)) {
    throw std::out_of_range("BitVector: range out of bounds");
  }

  BitVector result{};
  for (auto bitIndex{start}; bitIndex < end; bitIndex++) {
    result.appendBit(at(bitIndex));
  }

  return result;
}

std::vector<bool> BitVector::bits() const {
  std::vector<bool> result(_numBits, false);

  for (size_t bitIndex{0U}; bitIndex < _numBits; bitIndex++) {
    result[bitIndex] = at(bitIndex);
  }

  return result;
}

std::string BitVector::toString() const {
  std::string result{};
  result.reserve(_numBits);

  for (size_t bitIndex{0U}; bitIndex < _numBits; bitIndex++) {
    result.push_back(at(bitIndex) ? '1' : '0');
  }

  return result;
}

bool BitVector::operator==(const BitVector& other) const {
  if (_numBits != other._numBits) {
    return false;
  }

  // unused tail bits are always kept at 0 so whole bytes can be compared
  for (size_t byteNo{0U}; byteNo < (_numBits + 7U) / 8U; byteNo++) {
    if (_bytes[byteNo] != other._bytes[byteNo]) {
      return false;
    }
  }

  return true;
}

void BitVector::ensureCapacity(size_t numBits) {
  const auto bytesRequired{(numBits + 7U) / 8U};

  if (_bytes.size() < bytesRequired) {
    _bytes.resize(bytesRequired, 0U);
  }
}

}  // namespace tools
