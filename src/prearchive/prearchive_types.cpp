/**
 * @file prearchive_types.cpp
 * @brief Server status mapping and listing record parsing
 */

#include <xnat/prearchive/prearchive_types.hpp>

#include <algorithm>
#include <cctype>
#include <exception>

namespace xnat::prearchive {

namespace {

auto field(const nlohmann::json& record, const char* key) -> std::string {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

auto count_field(const nlohmann::json& record, const char* key) -> std::size_t {
    auto it = record.find(key);
    if (it == record.end()) {
        return 0;
    }
    if (it->is_number_integer()) {
        auto value = it->get<long long>();
        return value > 0 ? static_cast<std::size_t>(value) : 0;
    }
    if (it->is_string()) {
        try {
            return static_cast<std::size_t>(std::stoull(it->get<std::string>()));
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

}  // namespace

auto prearchive_status_from_server(std::string_view status) -> prearchive_status {
    std::string upper(status);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "READY") return prearchive_status::ready;
    if (upper == "ARCHIVING") return prearchive_status::archiving;
    if (upper == "ERROR" || upper == "CONFLICT") return prearchive_status::error;
    if (upper == "ARCHIVED") return prearchive_status::archived;
    if (upper == "DELETED") return prearchive_status::deleted;
    // RECEIVING, BUILDING, QUEUED_* and anything unrecognised
    return prearchive_status::receiving;
}

auto prearchive_entry::from_json(const nlohmann::json& record) -> prearchive_entry {
    prearchive_entry entry;
    entry.project = field(record, "project");
    entry.timestamp = field(record, "timestamp");
    entry.name = field(record, "name");
    entry.status = prearchive_status_from_server(field(record, "status"));
    entry.subject = field(record, "subject");
    entry.folder_name = field(record, "folderName");
    entry.uploaded = field(record, "uploaded");
    entry.scan_count = count_field(record, "scan_count");
    entry.url = field(record, "url");
    return entry;
}

}  // namespace xnat::prearchive
