/**
 * @file Helpers.hpp
 * @author Grzegorz Kaczmarek SP6HFE
 * @brief
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <Tools/BitVector.hpp>

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <vector>

namespace tools {

class Helpers {
public:
  static void printBinaryValue(uint8_t value) {
    for (auto bitCounter{0U}; bitCounter < 8U; bitCounter++) {
      printf((value & 0x80) ? "1" : "0");
      value <<= 1U;
    }
  }

  /**
   * @brief Print bit stream as codewords, binary and hex
   * @note Trailing bits not forming a full codeword are skipped.
   *
   * @param data Bit stream
   */
  static void printCodewords(const BitVector& data) {
    for (size_t bitNo{0U}; (bitNo + 8U) <= data.size(); bitNo += 8U) {
      const auto codeword{data.byteAt(bitNo)};
      printBinaryValue(codeword);
      printf("(%02X) ", codeword);
    }
  }

  /**
   * @brief Print module rows with half block characters, two rows per text line
   *
   * @param rows Module rows, true for dark
   */
  static void printModuleRows(const std::vector<std::vector<bool>>& rows) {
    for (size_t rowNo{0U}; rowNo < rows.size(); rowNo += 2U) {
      for (size_t columnNo{0U}; columnNo < rows[rowNo].size(); columnNo++) {
        const auto upper{rows[rowNo][columnNo]};
        const auto lower{((rowNo + 1U) < rows.size()) ? static_cast<bool>(rows[rowNo + 1U][columnNo]) : false};

        if (upper and lower) {
          printf("█");
        } else if (upper) {
          printf("▀");
        } else if (lower) {
          printf("▄");
        } else {
          printf(" ");
        }
      }
      printf("\n");
    }
  }
};

}  // namespace tools
