#include "llama_backend.hpp"

#include <llama.h>

#include <cstdio>
#include <mutex>

namespace paper_mt {

namespace {

std::once_flag g_backend_once;

void llama_log_errors_only(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (level == GGML_LOG_LEVEL_ERROR && text != nullptr) {
        std::fputs(text, stderr);
    }
}

}  // namespace

void initialize_llama_backend() {
    std::call_once(g_backend_once, []() {
        llama_log_set(llama_log_errors_only, nullptr);
        ggml_backend_load_all();
        llama_backend_init();
    });
}

}  // namespace paper_mt
