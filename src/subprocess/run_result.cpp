#include <batchgrader/subprocess/run_result.hpp>

#include <libassert/assert.hpp>

#include <sys/wait.h>

namespace batchgrader {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_killed(int signal) {
    return {Kind::Killed, signal};
}

RunResult RunResult::from_wait_status(int status) {
    if (WIFEXITED(status)) {
        return make_exited(WEXITSTATUS(status));
    }

    ASSERT(WIFSIGNALED(status), "Only terminated children should be decoded", status);

    return make_killed(WTERMSIG(status));
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

} // namespace batchgrader
