#include "advisory.hpp"

using namespace eglib;

auto Advisory::is_integrity() const noexcept -> bool {
    switch (kind) {
        case AdvisoryKind::HashMismatch:
        case AdvisoryKind::InflateShortfall:
        case AdvisoryKind::PayloadShortfall:
        case AdvisoryKind::Encrypted:
            return true;
        default:
            return false;
    }
}

auto eglib::to_string(AdvisoryKind kind) noexcept -> std::string_view {
    switch (kind) {
        case AdvisoryKind::HashMismatch:
            return "hash-mismatch";
        case AdvisoryKind::InflateShortfall:
            return "inflate-shortfall";
        case AdvisoryKind::PayloadShortfall:
            return "payload-shortfall";
        case AdvisoryKind::SizeMismatch:
            return "size-mismatch";
        case AdvisoryKind::Encrypted:
            return "encrypted";
        case AdvisoryKind::SectionMissing:
            return "section-missing";
        case AdvisoryKind::SectionTruncated:
            return "section-truncated";
        case AdvisoryKind::SectionInvalid:
            return "section-invalid";
        case AdvisoryKind::UnresolvedChunk:
            return "unresolved-chunk";
        case AdvisoryKind::DuplicateChunk:
            return "duplicate-chunk";
    }
    return "unknown";
}
