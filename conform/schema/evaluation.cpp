#include "evaluation.hpp"

#include "conform/schema/exception.hpp"
#include "conform/schema/keywords/keywords.hpp"

namespace conform::schema {

void ErrorSink::add(const Path& path, std::string_view keyword,
                    std::string message) {
    if (full()) {
        return;
    }
    errors_.emplace_back(path, std::string(keyword), std::move(message));
}

void ErrorSink::merge(ErrorSink&& other) {
    for (auto& error : other.errors_) {
        if (full()) {
            break;
        }
        errors_.push_back(std::move(error));
    }
    other.errors_.clear();
}

namespace {
class DepthGuard {
public:
    DepthGuard(std::size_t& depth, std::size_t limit, const Path& path)
        : depth_(depth) {
        if (++depth_ > limit) {
            --depth_;
            THROW_CONFIGURATION_ERROR(
                "", "Schema nesting exceeds the maximum depth of {} at \"{}\"",
                limit, pathToString(path));
        }
    }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    std::size_t& depth_;
};
}  // namespace

void Evaluation::validate(const Value& instance, const Value& schema,
                          Path& path, ErrorSink& sink) {
    if (sink.full()) {
        return;
    }
    if (!schema.is_object()) {
        THROW_CONFIGURATION_ERROR("", "Schema for \"{}\" must be an object, got {}",
                                  pathToString(path), schema.type_name());
    }
    DepthGuard guard(depth_, options_.max_depth, path);

    if (keywords::checkNullRequired(instance, schema, path, sink)) {
        return;
    }

    keywords::checkType(instance, schema, path, sink);
    keywords::checkEnum(instance, schema, path, sink);

    switch (value::kindOf(instance)) {
        case value::Kind::String:
            keywords::checkString(*this, instance, schema, path, sink);
            break;
        case value::Kind::Number:
            keywords::checkNumber(instance, schema, path, sink);
            break;
        default:
            break;
    }

    switch (value::kindOf(instance)) {
        case value::Kind::Mapping:
            keywords::checkObject(*this, instance, schema, path, sink);
            break;
        case value::Kind::Sequence:
            keywords::checkArray(*this, instance, schema, path, sink);
            break;
        default:
            break;
    }

    keywords::checkComposition(*this, instance, schema, path, sink);
}

auto Evaluation::conforms(const Value& instance, const Value& schema,
                          Path& path) -> bool {
    ErrorSink trial(1);
    validate(instance, schema, path, trial);
    return trial.empty();
}

auto Evaluation::regex(const std::string& pattern,
                       std::string_view keyword) -> const std::regex& {
    auto it = regexCache_.find(pattern);
    if (it != regexCache_.end()) {
        return it->second;
    }

    try {
        return regexCache_.emplace(pattern, std::regex(pattern))
            .first->second;
    } catch (const std::regex_error& e) {
        THROW_CONFIGURATION_ERROR(std::string(keyword),
                                  "Invalid regular expression \"{}\": {}",
                                  pattern, e.what());
    }
}

}  // namespace conform::schema
