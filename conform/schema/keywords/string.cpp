#include "keywords.hpp"

#include <regex>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "conform/format/registry.hpp"
#include "conform/schema/exception.hpp"
#include "conform/schema/keywords/support.hpp"

namespace conform::schema::keywords {

void checkString(Evaluation& eval, const Value& instance, const Value& schema,
                 const Path& path, ErrorSink& sink) {
    const std::string& text = instance.get_ref<const std::string&>();

    if (const Value* pattern = member(schema, "pattern")) {
        if (!pattern->is_string()) {
            THROW_CONFIGURATION_ERROR("pattern",
                                      "\"pattern\" must be a string, got {}",
                                      pattern->dump());
        }
        const std::string& source = pattern->get_ref<const std::string&>();
        if (!std::regex_search(text, eval.regex(source, "pattern"))) {
            sink.add(path, "pattern",
                     fmt::format("String \"{}\" does not match pattern {}",
                                 text, source));
        }
    }

    if (const Value* formatName = member(schema, "format")) {
        if (!formatName->is_string()) {
            THROW_CONFIGURATION_ERROR("format",
                                      "\"format\" must be a string, got {}",
                                      formatName->dump());
        }
        const std::string& name = formatName->get_ref<const std::string&>();
        const format::Format* known =
            format::FormatRegistry::instance().find(name);
        if (known == nullptr) {
            THROW_CONFIGURATION_ERROR("format", "Unknown format \"{}\"", name);
        }
        if (!eval.options().ignore_format && !known->matches(text)) {
            sink.add(path, "format",
                     fmt::format("String \"{}\" is not a valid {}", text,
                                 name));
        }
    }

    checkCount(value::codePointLength(text), schema, "minLength", "maxLength",
               "String length", path, sink);
}

}  // namespace conform::schema::keywords
