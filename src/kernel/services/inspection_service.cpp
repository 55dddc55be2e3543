#include "kernel/services/inspection_service.hpp"

namespace og {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const char* to_string(InspectionStatus status) {
    switch (status) {
        case InspectionStatus::OK:    return "OK";
        case InspectionStatus::NG:    return "NG";
        case InspectionStatus::Error: return "Error";
    }
    return "Error";
}

InspectionResult InspectionService::judge(RunOutcome outcome) {
    InspectionResult result;
    if (!outcome.succeeded()) {
        result.status = InspectionStatus::Error;
        result.message = std::string(to_string(outcome.error_code)) + ": " + outcome.error_message;
        result.run = std::move(outcome);
        return result;
    }

    bool failed_check = false;
    for (const auto& [key, value] : outcome.outputs) {
        if (ends_with(key, ".pass")) {
            if (auto b = std::get_if<bool>(&value); b && !*b) failed_check = true;
        } else if (ends_with(key, ".defect_count")) {
            if (auto d = std::get_if<double>(&value)) result.defect_count += *d;
        }
    }
    if (failed_check || result.defect_count > 0.0) {
        result.status = InspectionStatus::NG;
        result.message = "Inspection failed: " + std::to_string(static_cast<long long>(result.defect_count)) +
                         " defect(s).";
    } else {
        result.status = InspectionStatus::OK;
        result.message = "Inspection passed.";
    }
    result.run = std::move(outcome);
    return result;
}

InspectionResult InspectionService::inspect(const Flow& flow, const ImageBuffer& image,
                                            std::optional<std::chrono::milliseconds> timeout) {
    ValueMap inputs;
    inputs[kImageInput] = image;
    InspectionResult result = judge(scheduler_.run_flow(flow, inputs, timeout));
    if (sink_) sink_->consume(result);
    return result;
}

} // namespace og
