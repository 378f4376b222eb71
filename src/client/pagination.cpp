/**
 * @file pagination.cpp
 * @brief Offset/limit page fetching
 */

#include <xnat/client/pagination.hpp>

#include <vector>

namespace xnat::client {

auto extract_records(const nlohmann::json& envelope, const std::string& result_key)
    -> nlohmann::json {
    const nlohmann::json* node = &envelope;
    std::size_t start = 0;
    while (start <= result_key.size()) {
        auto dot = result_key.find('.', start);
        auto key = result_key.substr(start, dot == std::string::npos ? std::string::npos
                                                                      : dot - start);
        if (!key.empty()) {
            if (!node->is_object() || !node->contains(key)) {
                return nlohmann::json::array();
            }
            node = &(*node)[key];
        }
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return node->is_array() ? *node : nlohmann::json::array();
}

paged_listing::paged_listing(session_client& client, std::string path,
                             pagination_options options)
    : client_(&client), path_(std::move(path)), options_(std::move(options)) {
    if (options_.page_size == 0) {
        options_.page_size = 1;
    }
}

auto paged_listing::fetch_page() -> VoidResult {
    auto params = options_.params;
    // Paging keys replace any caller-supplied value
    std::erase_if(params, [](const auto& param) {
        return param.first == "format" || param.first == "offset" || param.first == "limit";
    });
    params.emplace_back("format", "json");
    params.emplace_back("offset", std::to_string(offset_));
    params.emplace_back("limit", std::to_string(options_.page_size));

    auto page = client_->get_json(path_, std::move(params));
    ++pages_fetched_;
    if (page.is_err()) {
        exhausted_ = true;
        return VoidResult(page.error());
    }

    auto records = extract_records(page.value(), options_.result_key);
    buffer_.clear();
    position_ = 0;
    for (auto& record : records) {
        buffer_.push_back(std::move(record));
    }

    offset_ += options_.page_size;
    if (buffer_.size() < options_.page_size) {
        exhausted_ = true;
    }
    return ok();
}

auto paged_listing::next() -> Result<std::optional<nlohmann::json>> {
    if (position_ >= buffer_.size()) {
        if (exhausted_) {
            return ok(std::optional<nlohmann::json>{});
        }
        auto fetched = fetch_page();
        if (fetched.is_err()) {
            return forward_error<std::optional<nlohmann::json>>(fetched.error());
        }
        if (buffer_.empty()) {
            return ok(std::optional<nlohmann::json>{});
        }
    }
    return ok(std::optional<nlohmann::json>{std::move(buffer_[position_++])});
}

auto paged_listing::collect_all() -> Result<std::vector<nlohmann::json>> {
    std::vector<nlohmann::json> records;
    while (true) {
        auto record = next();
        if (record.is_err()) {
            return forward_error<std::vector<nlohmann::json>>(record.error());
        }
        if (!record.value()) {
            break;
        }
        records.push_back(std::move(*record.value()));
    }
    return ok(std::move(records));
}

}  // namespace xnat::client
