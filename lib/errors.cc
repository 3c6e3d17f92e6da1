#include "energygraph/errors.h"
#include "energygraph/utils.h"

using namespace egraph;

const char *GraphError::getKindName(Kind kind) {
  switch (kind) {
  case DEGENERATE_RANGE:
    return "DegenerateRangeError";
  case MISSING_FIELD:
    return "MissingFieldError";
  case UNDEFINED_TANGENT:
    return "UndefinedTangentError";
  case INSUFFICIENT_DATA:
    return "InsufficientDataError";
  case WRITER_FAILURE:
    return "WriterFailureError";
  }
  egraph_unreachable("Unknown GraphError kind");
}
