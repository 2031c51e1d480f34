#include "Error.hpp"

#include "cpptrace/cpptrace.hpp"

#include <sstream>
#include <string>

namespace {

class StorageCategory : public std::error_category {
    public:
        const char* name() const noexcept override { return "piece-store"; }

        std::string message(int value) const override {
            switch (static_cast<store::StorageErrc>(value)) {
                case store::StorageErrc::invalid_piece_index:
                    return "piece index out of range";
                case store::StorageErrc::piece_size_mismatch:
                    return "piece size does not match the layout";
                case store::StorageErrc::fragment_write_failed:
                    return "failed to write fragment file";
                case store::StorageErrc::assembly_failed:
                    return "failed to assemble output file";
            }
            return "unknown storage error";
        }
};

}  // namespace

[[nodiscard]] std::string err::err_msg_with_trace(const std::string& msg) {
    std::ostringstream trace;

    cpptrace::generate_trace().print(trace);

    return std::string{msg + '\n' + trace.str()};
}

namespace store {

const std::error_category& storage_category() noexcept {
    static const StorageCategory category;
    return category;
}

}  // namespace store
