#pragma once

/** \file options.hpp
 *  \brief Evaluator configuration.
 */

#include <cstddef>
#include <expected>

#include "verdict/error.hpp"

namespace verdict {

/** \brief Tuning knobs shared by the operator table and the evaluators. */
struct evaluator_options {
  std::size_t num_threads{0};               /**< worker threads; 0 = hardware concurrency / 2 */
  std::size_t pattern_cache_capacity{256};  /**< compiled $regex patterns kept (LRU) */
  std::size_t pattern_cache_shards{8};      /**< lock shards of the pattern cache */
  std::size_t regex_max_subject_length{4096}; /**< longest string $regex will search */
  bool verbose{false};                      /**< per-run debug lines even without VERDICT_DEBUG */

  /** \brief config_invalid when a cache size or the regex subject limit is zero. */
  [[nodiscard]] auto validate() const -> std::expected<void, core::error>;

  /** \brief Defaults overridden by VERDICT_THREADS, VERDICT_PATTERN_CACHE_CAPACITY
   *  and VERDICT_DEBUG. Values that fail to parse or validate are logged as
   *  config_invalid and keep the default.
   */
  static auto from_env() -> evaluator_options;
};

} // namespace verdict
