#pragma once

namespace paper_mt {

// Loads ggml backends and initializes llama.cpp once per process. llama.cpp
// log output is reduced to errors.
void initialize_llama_backend();

}  // namespace paper_mt
