#ifndef CONFORM_SCHEMA_KEYWORDS_KEYWORDS_HPP
#define CONFORM_SCHEMA_KEYWORDS_KEYWORDS_HPP

#include "conform/schema/evaluation.hpp"
#include "conform/schema/result.hpp"
#include "conform/value/value.hpp"

/**
 * Keyword validators, one per keyword family. Each reads its keywords from
 * the schema node, reports failures to the sink at the given path and
 * throws ConfigurationError when a keyword value is malformed. Families gated
 * on the instance kind (string, number, object, array) expect the caller to
 * have checked that kind.
 */
namespace conform::schema::keywords {

/**
 * @brief Null / required short-circuit.
 *
 * For a null instance whose schema does not name the `null` type, the node
 * is settled here: valid, or one `required` error under `required: true`.
 *
 * @return true when the node needs no further evaluation.
 */
auto checkNullRequired(const Value& instance, const Value& schema,
                       const Path& path, ErrorSink& sink) -> bool;

/// `type`, a name or a list of names.
void checkType(const Value& instance, const Value& schema, const Path& path,
               ErrorSink& sink);

/// `enum`, membership by deep equality.
void checkEnum(const Value& instance, const Value& schema, const Path& path,
               ErrorSink& sink);

/// `pattern`, `format`, `minLength`, `maxLength`.
void checkString(Evaluation& eval, const Value& instance, const Value& schema,
                 const Path& path, ErrorSink& sink);

/// `minimum`, `maximum`, `divisibleBy`.
void checkNumber(const Value& instance, const Value& schema, const Path& path,
                 ErrorSink& sink);

/// `properties`, `patternProperties`, `additionalProperties`,
/// `dependencies`, `minProperties`, `maxProperties`.
void checkObject(Evaluation& eval, const Value& instance, const Value& schema,
                 Path& path, ErrorSink& sink);

/// `items`, `additionalItems`, `minItems`, `maxItems`, `uniqueItems`.
void checkArray(Evaluation& eval, const Value& instance, const Value& schema,
                Path& path, ErrorSink& sink);

/// `allOf`, `anyOf`, `oneOf`, `not`.
void checkComposition(Evaluation& eval, const Value& instance,
                      const Value& schema, Path& path, ErrorSink& sink);

}  // namespace conform::schema::keywords

#endif  // CONFORM_SCHEMA_KEYWORDS_KEYWORDS_HPP
