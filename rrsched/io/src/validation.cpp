#include <rrsched/io/validation.hpp>
#include <rrsched/io/error.hpp>

#include <string>

namespace rrsched::io {

namespace {

void check_name(const std::string& name, const std::string& context) {
    if (name.empty() || name.size() > TaskLimits::max_name_length) {
        throw ValidationError("name must be 1 to " + std::to_string(TaskLimits::max_name_length) +
                                  " characters",
                              context);
    }
}

void check_description(const std::string& description, const std::string& context) {
    if (description.size() > TaskLimits::max_description_length) {
        throw ValidationError("description must be at most " +
                                  std::to_string(TaskLimits::max_description_length) + " characters",
                              context);
    }
}

void check_priority(int priority, const std::string& context) {
    if (priority < TaskLimits::min_priority || priority > TaskLimits::max_priority) {
        throw ValidationError("priority must be in [" + std::to_string(TaskLimits::min_priority) + ", " +
                                  std::to_string(TaskLimits::max_priority) + "]",
                              context);
    }
}

void check_burst_time(core::Duration burst_time, const std::string& context) {
    if (burst_time <= core::Duration::zero() ||
        burst_time > core::duration_from_seconds(TaskLimits::max_burst_seconds)) {
        throw ValidationError("burst_time must be in (0, 300] seconds", context);
    }
}

} // anonymous namespace

void validate_task_spec(const core::TaskSpec& spec, const std::string& context) {
    check_name(spec.name, context);
    check_description(spec.description, context);
    check_priority(spec.priority, context);
    check_burst_time(spec.burst_time, context);
}

void validate_task_patch(const core::TaskPatch& patch, const std::string& context) {
    if (patch.empty()) {
        throw ValidationError("no fields to update", context);
    }
    if (patch.name) {
        check_name(*patch.name, context);
    }
    if (patch.description) {
        check_description(*patch.description, context);
    }
    if (patch.priority) {
        check_priority(*patch.priority, context);
    }
    if (patch.burst_time) {
        check_burst_time(*patch.burst_time, context);
    }
}

} // namespace rrsched::io
