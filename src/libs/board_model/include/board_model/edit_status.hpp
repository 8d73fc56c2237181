#pragma once

namespace board_model {

// Result of every mutating Board operation. The model never throws.
enum class EditStatus {
    Ok,
    NotFound,
    EmptyLabel,
    DegenerateRange,
    InvalidNumber,
    DuplicateId,
};

const char* to_string(EditStatus status);

// Human readable text for inline validation messages.
const char* describe(EditStatus status);

} // namespace board_model
