// gql_coerce/schema/schema.cpp - Resolver helpers
#include "gql_coerce/schema/schema.hpp"

#include <fmt/core.h>

#include "gql_coerce/value/value_printer.hpp"

namespace gql_coerce
{

ResolveResult ResolveResult::argument_mismatch(const ArgumentMap & args)
{
  ResolveResult r = fail(fmt::format("Got {} instead", inspect(args)));
  r.kind = FailureKind::ResolutionArgumentMismatch;
  return r;
}

}  // namespace gql_coerce
