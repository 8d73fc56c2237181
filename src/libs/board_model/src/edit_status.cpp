#include <board_model/edit_status.hpp>

namespace board_model {

const char* to_string(EditStatus status) {
    switch (status) {
    case EditStatus::Ok: return "ok";
    case EditStatus::NotFound: return "not_found";
    case EditStatus::EmptyLabel: return "empty_label";
    case EditStatus::DegenerateRange: return "degenerate_range";
    case EditStatus::InvalidNumber: return "invalid_number";
    case EditStatus::DuplicateId: return "duplicate_id";
    }
    return "unknown";
}

const char* describe(EditStatus status) {
    switch (status) {
    case EditStatus::Ok: return "";
    case EditStatus::NotFound: return "Item no longer exists";
    case EditStatus::EmptyLabel: return "Label must not be empty";
    case EditStatus::DegenerateRange: return "Axis minimum must be smaller than its maximum";
    case EditStatus::InvalidNumber: return "Coordinates must be finite numbers";
    case EditStatus::DuplicateId: return "Item id is already in use";
    }
    return "Unknown error";
}

} // namespace board_model
