#include "conform/schema/validator.hpp"

#include <fstream>
#include <iostream>

using namespace conform;
using namespace conform::schema;

namespace {
auto loadJson(const char* path) -> Value {
    std::ifstream file(path);
    if (!file) {
        THROW_INVALID_ARGUMENT("Cannot open {}", path);
    }
    return Value::parse(file);
}
}  // namespace

int main(int argc, char** argv) {
    // Define a schema for an incoming request
    Value schema = {
        {"type", "object"},
        {"properties",
         {
             {"name", {{"type", "string"}, {"required", true}}},
             {"age", {{"type", "integer"}, {"minimum", 0}}},
             {"email", {{"type", "string"}, {"format", "email"}}},
             {"tags",
              {{"type", "array"},
               {"items", {{"type", "string"}}},
               {"uniqueItems", true}}},
         }},
        {"additionalProperties", false}};

    Value instance = {{"age", -5},
                      {"email", "john.doe@example"},
                      {"tags", {"developer", 123, "developer"}},
                      {"nickname", "JD"}};

    try {
        // Replace the built-in pair with files given on the command line
        if (argc == 3) {
            schema = loadJson(argv[1]);
            instance = loadJson(argv[2]);
        } else if (argc != 1) {
            std::cerr << "Usage: " << argv[0] << " [schema.json instance.json]"
                      << std::endl;
            return 2;
        }

        Validator validator;
        auto errors = validator.validate(instance, schema);
        std::cout << "Instance is valid: " << std::boolalpha << errors.empty()
                  << std::endl;

        for (const auto& error : errors) {
            std::cout << "Error: " << error.message
                      << ", Path: " << pathToString(error.path)
                      << ", Keyword: " << error.keyword << std::endl;
        }
        std::cout << toJson(errors).dump(2) << std::endl;
        return errors.empty() ? 0 : 1;
    } catch (const ConfigurationError& e) {
        std::cerr << "Invalid schema (" << e.keyword()
                  << "): " << e.getMessage() << std::endl;
    } catch (const error::Exception& e) {
        std::cerr << e.getMessage() << std::endl;
    } catch (const Value::parse_error& e) {
        std::cerr << "Malformed JSON: " << e.what() << std::endl;
    }
    return 2;
}
