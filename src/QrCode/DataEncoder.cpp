#include <QrCode/DataEncoder.hpp>

#include <cstddef>
#include <stdexcept>
#include <utility>

namespace qrenc {

namespace {

struct BracketParameters {
  uint8_t minVersion;
  uint8_t maxVersion;
  uint8_t numericCharCountBits;
  uint8_t alphanumericCharCountBits;
  uint8_t byteCharCountBits;
};

// ISO/IEC 18004 table 3 (number of bits in character count indicator)
constexpr std::array<BracketParameters, 3U> BRACKET_PARAMETERS{{
    {1U, 9U, 10U, 9U, 8U},
    {10U, 26U, 12U, 11U, 16U},
    {27U, 40U, 14U, 13U, 16U},
}};

const BracketParameters& parametersOf(VersionBracket bracket) {
  return BRACKET_PARAMETERS.at(static_cast<uint8_t>(bracket));
}

}  // namespace

DataEncoder::DataEncoder(VersionBracket bracket) : _bracket(bracket) {}

std::optional<tools::BitVector> DataEncoder::encode(const std::vector<uint8_t>& data) {
  static constexpr bool AN_ERROR{true};

  _actual.clear();
  _optimised.clear();

  if (data.empty()) {
    return {};
  }

  // 1. Split the data into runs of the same data mode
  const auto highestRequiredMode{classifyDataModes(data)};

  // 2. Merge runs where mode switching costs more than a wider mode
  if (optimiseDataModes() == AN_ERROR) {
    return {};
  }

  // 3. Check if a single segment in the widest required mode would be shorter
  uint32_t optimisedLength{0U};
  for (const auto& segment : _optimised) {
    const auto segmentLength{encodedLength(segment.mode, segment.data.size())};
    if (not segmentLength.has_value()) {
      return {};
    }
    optimisedLength += segmentLength.value();
  }

  const auto singleSegmentLength{encodedLength(highestRequiredMode, data.size())};
  if (not singleSegmentLength.has_value()) {
    return {};
  }

  if (singleSegmentLength.value() <= optimisedLength) {
    _optimised.clear();
    _optimised.push_back({highestRequiredMode, data});
  }

  // 4. Encode the segments
  tools::BitVector encoded{};
  for (const auto& segment : _optimised) {
    encodeDataRaw(segment.data, segment.mode, encoded);
  }

  return encoded;
}

std::optional<uint32_t> DataEncoder::encodedLength(DataMode mode, size_t numChars) const {
  if (mode == DataMode::None) {
    return {};
  }

  const auto countBits{charCountBits(mode)};
  const auto maxNumChars{static_cast<size_t>((1UL << countBits) - 1UL)};

  if (numChars > maxNumChars) {
    return {};
  }

  auto length{static_cast<uint32_t>(MODE_INDICATOR_BITS + countBits)};
  const auto chars{static_cast<uint32_t>(numChars)};

  switch (mode) {
    case DataMode::Numeric:
      length += 10U * (chars / 3U);
      if ((chars % 3U) != 0U) {
        length += 1U + 3U * (chars % 3U);
      }
      break;
    case DataMode::Alphanumeric:
      length += 11U * (chars / 2U);
      length += 6U * (chars % 2U);
      break;
    default:
      length += 8U * chars;
      break;
  }

  return length;
}

void DataEncoder::encodeDataRaw(const std::vector<uint8_t>& data, DataMode mode, tools::BitVector& encoded) const {
  switch (mode) {
    case DataMode::Numeric:
      encoded.appendByte(NUMERIC_MODE_INDICATOR, MODE_INDICATOR_BITS);
      break;
    case DataMode::Alphanumeric:
      encoded.appendByte(ALPHANUMERIC_MODE_INDICATOR, MODE_INDICATOR_BITS);
      break;
    case DataMode::Byte:
      encoded.appendByte(BYTE_MODE_INDICATOR, MODE_INDICATOR_BITS);
      break;
    default:
      throw std::invalid_argument("DataEncoder: no data mode to encode with");
  }

  encoded.appendUint32(static_cast<uint32_t>(data.size()), charCountBits(mode));

  switch (mode) {
    case DataMode::Numeric:
      // groups of 3 digits -> 10 bits, 2 digits -> 7 bits, 1 digit -> 4 bits
      for (size_t charNo{0U}; charNo < data.size(); charNo += 3U) {
        uint32_t value{0U};
        uint8_t bitsUsed{1U};

        for (auto groupCharNo{charNo}; (groupCharNo < data.size()) and (groupCharNo < charNo + 3U); groupCharNo++) {
          value = (value * 10U) + static_cast<uint32_t>(data[groupCharNo] - '0');
          bitsUsed += 3U;
        }

        encoded.appendUint32(value, bitsUsed);
      }
      break;
    case DataMode::Alphanumeric:
      // pairs -> 11 bits, single trailing character -> 6 bits
      for (size_t charNo{0U}; charNo < data.size(); charNo += 2U) {
        uint32_t value{0U};

        for (auto pairCharNo{charNo}; (pairCharNo < data.size()) and (pairCharNo < charNo + 2U); pairCharNo++) {
          value = (value * ALPHANUMERIC_CHARSET_SIZE) + alphanumericValue(data[pairCharNo]);
        }

        encoded.appendUint32(value, ((data.size() - charNo) > 1U) ? 11U : 6U);
      }
      break;
    default:
      encoded.appendBytes(data);
      break;
  }
}

uint8_t DataEncoder::getMinVersion() const {
  return parametersOf(_bracket).minVersion;
}

uint8_t DataEncoder::getMaxVersion() const {
  return parametersOf(_bracket).maxVersion;
}

uint8_t DataEncoder::charCountBits(DataMode mode) const {
  const auto& parameters{parametersOf(_bracket)};

  switch (mode) {
    case DataMode::Numeric:
      return parameters.numericCharCountBits;
    case DataMode::Alphanumeric:
      return parameters.alphanumericCharCountBits;
    case DataMode::Byte:
      return parameters.byteCharCountBits;
    default:
      throw std::invalid_argument("DataEncoder: no character count field for data mode None");
  }
}

DataMode DataEncoder::classify(uint8_t value) {
  if ((value >= '0') and (value <= '9')) {
    return DataMode::Numeric;
  }

  if (((value >= 'A') and (value <= 'Z')) or (value == ' ') or (value == '$') or (value == '%') or (value == '*') or (value == '+') or (value == '-') or (value == '.') or (value == '/') or (value == ':')) {
    return DataMode::Alphanumeric;
  }

  return DataMode::Byte;
}

uint8_t DataEncoder::alphanumericValue(uint8_t character) {
  if ((character >= '0') and (character <= '9')) {
    return static_cast<uint8_t>(character - '0');
  }

  if ((character >= 'A') and (character <= 'Z')) {
    return static_cast<uint8_t>(character - 'A' + 10U);
  }

  switch (character) {
    case ' ':
      return 36U;
    case '$':
      return 37U;
    case '%':
      return 38U;
    case '*':
      return 39U;
    case '+':
      return 40U;
    case '-':
      return 41U;
    case '.':
      return 42U;
    case '/':
      return 43U;
    case ':':
      return 44U;
    default:
      throw std::invalid_argument("DataEncoder: character outside alphanumeric mode alphabet");
  }
}

DataMode DataEncoder::classifyDataModes(const std::vector<uint8_t>& data) {
  size_t runStart{0U};
  auto mode{DataMode::None};
  auto highestRequiredMode{DataMode::None};

  for (size_t index{0U}; index < data.size(); index++) {
    const auto newMode{classify(data[index])};

    if (newMode != mode) {
      if (index > 0U) {
        _actual.push_back({mode, std::vector<uint8_t>(data.cbegin() + static_cast<std::ptrdiff_t>(runStart), data.cbegin() + static_cast<std::ptrdiff_t>(index))});
        runStart = index;
      }
      mode = newMode;
    }

    if (newMode > highestRequiredMode) {
      highestRequiredMode = newMode;
    }
  }

  _actual.push_back({mode, std::vector<uint8_t>(data.cbegin() + static_cast<std::ptrdiff_t>(runStart), data.cend())});

  return highestRequiredMode;
}

bool DataEncoder::optimiseDataModes() {
  static constexpr bool NO_ERROR{false};
  static constexpr bool AN_ERROR{true};

  for (size_t segmentNo{0U}; segmentNo < _actual.size();) {
    const auto mode{_actual[segmentNo].mode};
    auto numChars{_actual[segmentNo].data.size()};

    // absorb following runs of the same or a more compact mode while it shortens the output
    auto nextSegmentNo{segmentNo + 1U};
    while (nextSegmentNo < _actual.size()) {
      const auto nextMode{_actual[nextSegmentNo].mode};
      const auto nextNumChars{_actual[nextSegmentNo].data.size()};

      if (nextMode > mode) {
        break;
      }

      const auto coalescedLength{encodedLength(mode, numChars + nextNumChars)};
      const auto separateLength1{encodedLength(mode, numChars)};
      const auto separateLength2{encodedLength(nextMode, nextNumChars)};

      if ((not coalescedLength.has_value()) or (not separateLength1.has_value()) or (not separateLength2.has_value())) {
        return AN_ERROR;
      }

      if (coalescedLength.value() < (separateLength1.value() + separateLength2.value())) {
        numChars += nextNumChars;
        nextSegmentNo++;
      } else {
        break;
      }
    }

    Segment optimised{mode, {}};
    optimised.data.reserve(numChars);
    for (auto mergedSegmentNo{segmentNo}; mergedSegmentNo < nextSegmentNo; mergedSegmentNo++) {
      optimised.data.insert(optimised.data.end(), _actual[mergedSegmentNo].data.cbegin(), _actual[mergedSegmentNo].data.cend());
    }
    _optimised.push_back(std::move(optimised));

    segmentNo = nextSegmentNo;
  }

  return NO_ERROR;
}

}  // namespace qrenc
