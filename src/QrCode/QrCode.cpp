#include <QrCode/QrCode.hpp>

#include <utility>

namespace qrenc {

QrCode::QrCode(const Version& version, tools::BitVector data, uint8_t maskPattern, Symbol symbol)
    : _version(version), _data(std::move(data)), _maskPattern(maskPattern), _symbol(std::move(symbol)) {}

std::vector<std::vector<bool>> QrCode::bitmap() const {
  return _symbol.bitmap();
}

uint16_t QrCode::size() const {
  return _symbol.getFullSize();
}

}  // namespace qrenc
