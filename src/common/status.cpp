#include "common/status.hpp"

namespace codebox {
using namespace std;

const char *get_display_message(error_kind kind) {
    switch (kind) {
        case error_kind::VALIDATION_ERROR:
            return "ValidationError";
        case error_kind::SNIPPET_RUNTIME_ERROR:
            return "SnippetRuntimeError";
        case error_kind::SNIPPET_SYNTAX_ERROR:
            return "SnippetSyntaxError";
        case error_kind::TIMEOUT:
            return "Timeout";
        case error_kind::MEMORY_LIMIT_EXCEEDED:
            return "MemoryLimitExceeded";
        case error_kind::WORKER_CRASHED:
            return "WorkerCrashed";
    }
    return "Unknown";
}

}  // namespace codebox
