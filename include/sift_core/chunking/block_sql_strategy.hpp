#pragma once

#include <regex>

#include "sift_core/chunking/chunk_strategy.hpp"

namespace sift_core {

/**
 * @class BlockSqlStrategy
 * @brief Chunks SQL scripts by CREATE PROCEDURE/FUNCTION/TRIGGER/VIEW blocks.
 *
 * A block over budget is cut where BEGIN/END depth returns to zero, then at
 * ';' terminators. Anything still over budget goes through the forced split.
 * Scripts with no CREATE blocks are cut at ';' terminators only.
 */
class BlockSqlStrategy : public ChunkStrategy {
 public:
  BlockSqlStrategy();

  ContentKind kind() const override {
    return ContentKind::BlockSql;
  }
  bool has_markers(std::string_view text) const override;
  std::vector<ChunkSpan> split(const SpanTokenCounter &counter,
                               const ChunkBudget &budget) const override;

 private:
  std::vector<TextSpan> block_units(std::string_view text) const;
  std::vector<TextSpan> begin_end_units(std::string_view text, const TextSpan &span) const;
  std::vector<TextSpan> statement_units(std::string_view text, const TextSpan &span) const;

  std::regex create_regex_;
  std::regex begin_regex_;
  std::regex end_regex_;
};

}  // namespace sift_core
