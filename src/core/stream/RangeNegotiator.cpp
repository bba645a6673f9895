#include "RangeNegotiator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "ClientError.hpp"

namespace renterd::core {

RangeNegotiator::RangeNegotiator(std::optional<uint64_t> total_length)
    : total_length_(total_length) {}

ReadPlan RangeNegotiator::plan(uint64_t position, size_t requested_len,
                               const BufferedWindow& window,
                               std::optional<uint64_t> slice_end) const {
    ReadPlan plan;
    if (requested_len == 0) {
        plan.action = ReadPlan::Action::Noop;
        return plan;
    }

    if (total_length_ && position >= *total_length_) {
        plan.action = ReadPlan::Action::EndOfObject;
        return plan;
    }

    if (window.valid()) {
        if (window.start() <= position && position < window.end()) {
            plan.action = ReadPlan::Action::Serve;
            plan.from_buffer = static_cast<size_t>(window.end() - position);
            return plan;
        }
        // The body continues exactly where the buffered bytes stop.
        if (position == window.end() && body_live()) {
            plan.action = ReadPlan::Action::Serve;
            plan.from_buffer = 0;
            return plan;
        }
    }

    plan.action = ReadPlan::Action::Fetch;
    plan.range.start = position;
    if (slice_end) {
        uint64_t end = std::max(*slice_end, position + 1);
        if (total_length_) {
            end = std::min(end, *total_length_);
        }
        plan.range.end = end;
    }
    return plan;
}

void RangeNegotiator::observe_total_length(uint64_t total) {
    if (total_length_ && *total_length_ != total) {
        throw ClientError(ErrorKind::Protocol,
                          "server reported object length " + std::to_string(total) +
                              " but " + std::to_string(*total_length_) + " was observed before");
    }
    if (!total_length_) {
        spdlog::debug("Object length resolved to {} bytes", total);
    }
    total_length_ = total;
}

void RangeNegotiator::on_body_opened(const ByteRange& range) {
    body_range_ = range;
    exhausted_ = false;
}

void RangeNegotiator::on_body_exhausted(uint64_t end_offset) {
    if (!body_range_) {
        return;
    }
    exhausted_ = true;
    if (body_range_->end) {
        if (end_offset < *body_range_->end) {
            throw ClientError(ErrorKind::Protocol,
                              "response body ended at offset " + std::to_string(end_offset) +
                                  ", expected " + std::to_string(*body_range_->end));
        }
        return;
    }
    // An open-ended body stops at the end of the object.
    if (total_length_ && end_offset < *total_length_) {
        throw ClientError(ErrorKind::Protocol,
                          "response body ended at offset " + std::to_string(end_offset) +
                              " before the object length " + std::to_string(*total_length_));
    }
    observe_total_length(end_offset);
}

void RangeNegotiator::on_body_released() noexcept {
    body_range_.reset();
    exhausted_ = false;
}

}  // namespace renterd::core
