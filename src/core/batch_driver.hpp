#pragma once

#include "../compute/worker_pool.hpp"
#include "../util/logger.hpp"
#include <chipper/chipper_error.h>
#include <chipper/chipper_types.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace chipper {

// Result of encoding one input: tokens on success, code and message otherwise
struct EncodeOutcome {
    chipper_error_t error = CHIPPER_SUCCESS;
    std::string message;
    std::vector<chipper_token_t> tokens;

    bool ok() const { return error == CHIPPER_SUCCESS; }
};

/**
 * BatchDriver - Encodes many inputs concurrently
 *
 * Inputs are cut into contiguous slices, one per worker, and every outcome
 * is written to the slot of its input, so output order always matches input
 * order. A failing input only fails its own slot.
 *
 * The cancel callback, when set, is polled before each item from every
 * worker and must be safe to call concurrently. Once it returns true, every
 * item not yet started reports CHIPPER_ERROR_CANCELLED.
 */
class BatchDriver {
public:
    using EncodeFn = std::function<std::vector<chipper_token_t>(std::string_view)>;

    BatchDriver(EncodeFn encode, int num_threads);

    BatchDriver(const BatchDriver&) = delete;
    BatchDriver& operator=(const BatchDriver&) = delete;

    std::vector<EncodeOutcome> run(const std::vector<std::string_view>& inputs,
                                   const chipper_batch_config_t& config);

    int num_threads() const { return pool_.num_threads(); }

    // Run encode on one input, turning its exception into an outcome
    static EncodeOutcome capture(const EncodeFn& encode, std::string_view input);

private:
    EncodeFn encode_;
    WorkerPool pool_;
    Logger logger_;
};

} // namespace chipper
