/**
 * @file entity_codec.hpp
 * @brief JSON wire format of replicated entities
 *
 * Field names are camelCase and timestamps are epoch milliseconds so that
 * documents written by other clients of the same remote partition decode
 * unchanged.
 */

#pragma once

#include <recall/core/card.hpp>
#include <recall/core/result.hpp>

#include <nlohmann/json.hpp>

namespace recall::sync {

[[nodiscard]] auto encode(const card& c) -> nlohmann::json;
[[nodiscard]] auto encode(const deck& d) -> nlohmann::json;
[[nodiscard]] auto encode(const review_log& log) -> nlohmann::json;

/**
 * @brief Decode a card document
 *
 * Missing optional fields take their defaults (new-card scheduling state).
 * @return error_codes::remote_decode_error if "id" is missing or a field
 *         has the wrong type
 */
[[nodiscard]] auto decode_card(const nlohmann::json& doc) -> Result<card>;

[[nodiscard]] auto decode_deck(const nlohmann::json& doc) -> Result<deck>;

/**
 * @return error_codes::remote_decode_error also for an unknown rating
 */
[[nodiscard]] auto decode_review_log(const nlohmann::json& doc) -> Result<review_log>;

}  // namespace recall::sync
