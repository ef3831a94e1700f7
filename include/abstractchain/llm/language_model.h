// abstractchain/llm/language_model.h
#ifndef ABSTRACTCHAIN_LLM_LANGUAGE_MODEL_H
#define ABSTRACTCHAIN_LLM_LANGUAGE_MODEL_H

#include <string>

namespace abstractchain {

// Text in, text out. Used both as the plan source and as the refinement sink.
// Implementations report failure by throwing.
class LanguageModel {
public:
    virtual ~LanguageModel() = default;
    virtual std::string generate(const std::string& prompt) = 0;

    // May be called from another thread while generate() runs. Models that
    // can stop early make the pending and later generate() calls throw.
    virtual void cancel() {}
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_LLM_LANGUAGE_MODEL_H
