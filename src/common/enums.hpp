#pragma once

namespace tidemark {

enum class ChangeKind {
    Created,
    Modified,
    Deleted,
    Moved
};

} // namespace tidemark
