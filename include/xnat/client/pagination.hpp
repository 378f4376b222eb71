/**
 * @file pagination.hpp
 * @brief Lazy iterator over offset/limit listing endpoints
 *
 * @code
 * auto listing = client.paginate("/data/projects");
 * while (true) {
 *     auto next = listing.next();
 *     if (next.is_err()) { ... }
 *     if (!next.value()) break;
 *     use(*next.value());
 * }
 * @endcode
 */

#pragma once

#include <xnat/client/session_client.hpp>
#include <xnat/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace xnat::client {

struct pagination_options {
    std::size_t page_size{100};
    std::string result_key{"ResultSet.Result"};  ///< Dotted path into the JSON envelope
    http::query_params params;                   ///< Extra filters sent with every page
};

/**
 * @brief Navigate @p envelope by a dotted key path
 * @return The array found there, or an empty array if any key is missing
 *         or the value is not an array
 */
[[nodiscard]] auto extract_records(const nlohmann::json& envelope,
                                   const std::string& result_key) -> nlohmann::json;

/**
 * @brief Single-pass sequence of listing records
 *
 * Pages are fetched on demand: GET path?format=json&offset=O&limit=L.
 * Iteration stops after an empty page or a page shorter than the limit.
 * A failed fetch is reported once and leaves the listing exhausted.
 * Not restartable; create a new listing to iterate again.
 */
class paged_listing {
public:
    paged_listing(session_client& client, std::string path,
                  pagination_options options = {});

    /**
     * @brief Next record, std::nullopt at the end, or the fetch error
     */
    [[nodiscard]] auto next() -> Result<std::optional<nlohmann::json>>;

    /**
     * @brief Drain the remaining records
     */
    [[nodiscard]] auto collect_all() -> Result<std::vector<nlohmann::json>>;

    [[nodiscard]] auto pages_fetched() const noexcept -> std::size_t { return pages_fetched_; }

    [[nodiscard]] bool is_exhausted() const noexcept {
        return exhausted_ && position_ >= buffer_.size();
    }

private:
    session_client* client_;
    std::string path_;
    pagination_options options_;

    std::size_t offset_{0};
    std::size_t pages_fetched_{0};
    std::vector<nlohmann::json> buffer_;
    std::size_t position_{0};
    bool exhausted_{false};

    [[nodiscard]] auto fetch_page() -> VoidResult;
};

}  // namespace xnat::client
