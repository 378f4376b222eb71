/**
 * @file transfer_types.cpp
 * @brief Summary aggregation
 */

#include <xnat/transfer/transfer_types.hpp>

namespace xnat::transfer {

auto describe(const error_info& err) -> std::string {
    if (err.details.empty()) {
        return err.message;
    }
    return err.message + ": " + err.details;
}

auto transfer_summary::from_units(const std::vector<transfer_unit>& units,
                                  std::chrono::milliseconds elapsed) -> transfer_summary {
    transfer_summary summary;
    summary.total = units.size();
    summary.elapsed = elapsed;

    for (const auto& unit : units) {
        if (unit.status == unit_status::succeeded) {
            ++summary.succeeded;
            summary.bytes_transferred += unit.size_bytes;
            summary.succeeded_ids.push_back(unit.id);
            continue;
        }

        // Anything not succeeded at the end of a run counts as failed
        ++summary.failed;
        unit_error entry{unit.id, "not attempted", error_codes::operation_cancelled};
        if (unit.last_error) {
            entry.message = describe(*unit.last_error);
            entry.code = unit.last_error->code;
        }
        summary.errors.push_back(std::move(entry));
    }
    return summary;
}

}  // namespace xnat::transfer
