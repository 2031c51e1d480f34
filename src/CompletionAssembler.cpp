#include "CompletionAssembler.hpp"

#include "Error.hpp"
#include "File.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <utility>

namespace store {

CompletionAssembler::CompletionAssembler(std::shared_ptr<const PieceLayout> layout)
    : layout_{std::move(layout)} {
    if (!layout_) {
        err::throw_with_trace<std::invalid_argument>("CompletionAssembler requires a layout");
    }

    const auto outputs{layout_->get_outputs()};
    states_.resize(outputs.size(), AssemblyState::PENDING);

    // Restore the outputs assembled by a previous run
    for (size_t file_idx{0}; file_idx < outputs.size(); ++file_idx) {
        std::error_code ec;
        if (std::filesystem::exists(layout_->get_marker_path(file_idx), ec) &&
            fs::is_present(outputs[file_idx].path, outputs[file_idx].length)) {
            states_[file_idx] = AssemblyState::DONE;
            ++assembled_cnt_;
        }
    }

    if (assembled_cnt_ > 0) {
        LOG_INFO("{} of {} output file(s) already assembled", assembled_cnt_, outputs.size());
    }
}

PromotionResult CompletionAssembler::promote_completed() {
    PromotionResult result;
    const auto      outputs{layout_->get_outputs()};

    for (size_t file_idx{0}; file_idx < outputs.size(); ++file_idx) {
        if (get_state(file_idx) != AssemblyState::PENDING ||
            !dependencies_present(outputs[file_idx])) {
            continue;
        }

        // Claim the output: another caller may have claimed it since the check above
        {
            std::scoped_lock lock(states_mutex_);
            if (states_[file_idx] != AssemblyState::PENDING) {
                continue;
            }
            states_[file_idx] = AssemblyState::ASSEMBLING;
        }

        auto assembled = assemble(file_idx);

        std::scoped_lock lock(states_mutex_);
        if (assembled) {
            states_[file_idx] = AssemblyState::DONE;
            ++assembled_cnt_;
            result.assembled.push_back(file_idx);
        } else {
            states_[file_idx] = AssemblyState::PENDING;
            LOG_ERROR(
                "Failed to assemble {}: {}",
                outputs[file_idx].path.string(),
                assembled.error().message
            );
            result.failures.push_back(std::move(assembled.error()));
        }
    }

    return result;
}

AssemblyState CompletionAssembler::get_state(size_t file_index) const {
    std::scoped_lock lock(states_mutex_);
    return states_.at(file_index);
}

bool CompletionAssembler::all_assembled() const {
    std::scoped_lock lock(states_mutex_);
    return assembled_cnt_ == states_.size();
}

bool CompletionAssembler::dependencies_present(const OutputFile& output) {
    return std::ranges::all_of(output.dependencies, [](const Fragment& fragment) {
        return fs::is_present(fragment.path, fragment.length);
    });
}

auto CompletionAssembler::assemble(size_t file_index) -> std::expected<void, OutputError> {
    const auto& output{layout_->get_outputs()[file_index]};

    // The output is built under a temporary name, so it never exists half written and
    // assembling it again starts from scratch
    const auto tmp_path{layout_->get_assembling_path(file_index)};

    try {
        {
            fs::File out_file{tmp_path, fs::File::Mode::truncate};

            for (const auto& fragment : output.dependencies) {
                fs::File in_file{fragment.path, fs::File::Mode::read};
                auto     data{in_file.read_all()};

                if (data.size() != fragment.length) {
                    err::throw_with_trace<fs::FileError>(std::format(
                        "Fragment {} has {} bytes, expected {}",
                        fragment.path.string(),
                        data.size(),
                        fragment.length
                    ));
                }
                out_file.write(data);
            }

            out_file.close();
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, output.path, ec);
        if (ec) {
            err::throw_with_trace<fs::FileError>(std::format(
                "Failed to move {} into place: {}", output.path.string(), ec.message()
            ));
        }

        fs::write_file_atomically(layout_->get_marker_path(file_index), {});
    } catch (const fs::FileError& e) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);

        return std::unexpected(OutputError{file_index, StorageErrc::assembly_failed, e.what()});
    }

    LOG_INFO(
        "Assembled {} ({} bytes) from {} fragment(s)",
        output.path.string(),
        output.length,
        output.dependencies.size()
    );

    return {};
}

}  // namespace store
