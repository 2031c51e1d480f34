#pragma once

#include "PieceLayout.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace store {

enum class AssemblyState { PENDING, ASSEMBLING, DONE };

struct OutputError {
        size_t          file_index{};
        std::error_code error;
        std::string     message;
};

struct PromotionResult {
        // indices (in manifest order) of the outputs assembled by this call
        std::vector<size_t>      assembled;
        std::vector<OutputError> failures;

        [[nodiscard]] bool ok() const { return failures.empty(); }
};

/**
 * Turns the fragments of an output file into the output file once they are all on disk.
 *
 * An output moves PENDING -> ASSEMBLING -> DONE exactly once. DONE is persisted with a marker
 * file next to the fragments, so a new assembler over the same root never assembles an
 * output twice. The assembler may be shared between threads.
 */
class CompletionAssembler {
    public:
        explicit CompletionAssembler(std::shared_ptr<const PieceLayout> layout);

        CompletionAssembler(const CompletionAssembler&)            = delete;
        CompletionAssembler& operator=(const CompletionAssembler&) = delete;
        CompletionAssembler(CompletionAssembler&&)                 = delete;
        CompletionAssembler& operator=(CompletionAssembler&&)      = delete;
        ~CompletionAssembler()                                     = default;

        /**
         * @brief Assemble every pending output whose fragments are all present
         * Outputs with a missing fragment are left untouched and retried on the next call.
         *
         * @return the outputs assembled by this call and the ones that failed
         */
        PromotionResult promote_completed();

        /**
         * @brief Get the assembly state of an output file
         *
         * @param file_index  the index of the output in manifest order
         * @return the state of the output
         */
        [[nodiscard]] AssemblyState get_state(size_t file_index) const;

        [[nodiscard]] bool is_assembled(size_t file_index) const {
            return get_state(file_index) == AssemblyState::DONE;
        }

        /**
         * @brief Check if every output file has been assembled
         *
         * @return true if all outputs are assembled
         * @note This function is thread-safe
         */
        [[nodiscard]] bool all_assembled() const;

    private:
        /**
         * @brief Check that every fragment of an output is on disk with its full length
         */
        [[nodiscard]] static bool dependencies_present(const OutputFile& output);

        /**
         * @brief Concatenate the fragments of an output and persist its completion
         *
         * @param file_index  the index of the output
         * @return nothing on success, the reason of the failure otherwise
         */
        auto assemble(size_t file_index) -> std::expected<void, OutputError>;

        std::shared_ptr<const PieceLayout> layout_;
        mutable std::mutex                 states_mutex_;
        std::vector<AssemblyState>         states_;
        size_t                             assembled_cnt_{0};
};

}  // namespace store
