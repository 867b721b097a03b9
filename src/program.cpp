#include <QrCode/QrEncoder.hpp>
#include <Tools/Helpers.hpp>

#include <iostream>
#include <iterator>
#include <optional>
#include <stdio.h>
#include <string>
#include <utility>
#include <vector>

using namespace std;

static constexpr auto DEFAULT_RECOVERY_LEVEL{qrenc::RecoveryLevel::Medium};

const char* levelName(qrenc::RecoveryLevel level) {
  switch (level) {
    case qrenc::RecoveryLevel::Low:
      return "L";
    case qrenc::RecoveryLevel::High:
      return "Q";
    case qrenc::RecoveryLevel::Highest:
      return "H";
    default:
      return "M";
  }
}

std::optional<qrenc::RecoveryLevel> parseLevel(const std::string& argument) {
  if (argument == "L") {
    return qrenc::RecoveryLevel::Low;
  }
  if (argument == "M") {
    return qrenc::RecoveryLevel::Medium;
  }
  if (argument == "Q") {
    return qrenc::RecoveryLevel::High;
  }
  if (argument == "H") {
    return qrenc::RecoveryLevel::Highest;
  }
  return {};
}

#ifdef DEBUG
const char* modeName(qrenc::DataMode mode) {
  switch (mode) {
    case qrenc::DataMode::Numeric:
      return "numeric";
    case qrenc::DataMode::Alphanumeric:
      return "alphanumeric";
    case qrenc::DataMode::Byte:
      return "byte";
    default:
      return "none";
  }
}
#endif

int main(int argc, char* argv[]) {
  auto level{DEFAULT_RECOVERY_LEVEL};
  auto includeQuietZone{true};

  for (auto argNo{1}; argNo < argc; argNo++) {
    const std::string argument{argv[argNo]};

    if (argument == "--no-border") {
      includeQuietZone = false;
      continue;
    }

    const auto levelGetter{parseLevel(argument)};
    if (not levelGetter.has_value()) {
      printf("E: Unknown argument '%s' (usage: qrenc [L|M|Q|H] [--no-border] < content)\n", argument.c_str());
      return 1;
    }
    level = levelGetter.value();
  }

  std::string content((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

  // drop the line ending left by echo and friends
  if ((not content.empty()) and (content.back() == '\n')) {
    content.pop_back();
    if ((not content.empty()) and (content.back() == '\r')) {
      content.pop_back();
    }
  }

  qrenc::QrEncoder encoder{level, includeQuietZone};

#ifdef DEBUG
  auto handleSegments{[](std::pair<const std::vector<qrenc::Segment>&, const qrenc::Version&> segmentDetails) {
    printf("┌ Version %d-%s (%u data bits, %d blocks)\n", segmentDetails.second.getNumber(), levelName(segmentDetails.second.getLevel()), segmentDetails.second.numDataBits(), segmentDetails.second.numBlocks());
    for (const auto& segment : segmentDetails.first) {
      printf("├ %s segment, %zu characters\n", modeName(segment.mode), segment.data.size());
    }
  }};

  auto handleMaskPenalty{[](std::pair<uint8_t, uint32_t> maskDetails) {
    printf("├ mask %d penalty: %u\n", maskDetails.first, maskDetails.second);
  }};

  encoder.registerSegmentsCallback(handleSegments);
  encoder.registerMaskPenaltyCallback(handleMaskPenalty);
#endif

  const auto code{encoder.encode(content)};
  if (not code.has_value()) {
    printf("E: Content can't be encoded at level %s (empty or too long)\n", levelName(level));
    return 1;
  }

#ifdef DEBUG
  printf("├ codewords: ");
  tools::Helpers::printCodewords(code.value().getData());
  printf("\n└ chosen mask %d\n", code.value().getMask());
#endif

  tools::Helpers::printModuleRows(code.value().bitmap());

  return 0;
}
