#include "batch_driver.hpp"
#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <new>

namespace chipper {

BatchDriver::BatchDriver(EncodeFn encode, int num_threads)
    : encode_(std::move(encode)), pool_(num_threads), logger_(create_logger("BatchDriver")) {}

EncodeOutcome BatchDriver::capture(const EncodeFn& encode, std::string_view input) {
    EncodeOutcome outcome;
    try {
        outcome.tokens = encode(input);
    } catch (const Error& e) {
        outcome.error = e.code();
        outcome.message = e.what();
    } catch (const std::bad_alloc&) {
        outcome.error = CHIPPER_ERROR_OUT_OF_MEMORY;
        outcome.message = "Out of memory";
    } catch (const std::exception& e) {
        outcome.error = CHIPPER_ERROR_UNKNOWN;
        outcome.message = e.what();
    }
    if (!outcome.ok()) {
        outcome.tokens.clear();
    }
    return outcome;
}

std::vector<EncodeOutcome> BatchDriver::run(const std::vector<std::string_view>& inputs,
                                            const chipper_batch_config_t& config) {
    std::vector<EncodeOutcome> outcomes(inputs.size());
    if (inputs.empty()) return outcomes;

    auto start_time = std::chrono::steady_clock::now();
    std::atomic<bool> cancelled{false};
    std::atomic<size_t> failed{0};

    pool_.parallel_for(0, static_cast<int64_t>(inputs.size()), [&](int64_t begin, int64_t end) {
        for (int64_t i = begin; i < end; ++i) {
            EncodeOutcome& outcome = outcomes[static_cast<size_t>(i)];

            if (!cancelled.load(std::memory_order_relaxed) && config.cancel != nullptr &&
                config.cancel(config.user_data)) {
                cancelled = true;
            }
            if (cancelled.load(std::memory_order_relaxed)) {
                outcome.error = CHIPPER_ERROR_CANCELLED;
                outcome.message = "Batch cancelled before this input was processed";
                continue;
            }

            outcome = capture(encode_, inputs[static_cast<size_t>(i)]);
            if (!outcome.ok()) {
                ++failed;
            }
        }
    }, 1);

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger_->debug("Encoded batch of {} inputs in {} us ({} failed{})", inputs.size(), elapsed.count(),
                   failed.load(), cancelled ? ", cancelled" : "");
    return outcomes;
}

} // namespace chipper
