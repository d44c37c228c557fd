#pragma once

// ============================================================
// merge_engine.hpp -- Ordered reassembly of a completed session
//   chunk 0..N-1 -> <staging>/<id>/merge.tmp -> fsync -> rename
//   into the output area. Never throws: the outcome says whether
//   the caller may tear the session down.
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"
#include "session_registry.hpp"
#include "chunk_store.hpp"
#include "artifact_catalog.hpp"
#include <string>

struct MergeOutcome {
    enum class Status { MERGED, FAILED };

    Status        status{Status::FAILED};

    // MERGED
    std::string   artifact_name;
    std::string   artifact_path;
    u64           bytes_written{0};
    hash::Hash128 digest{};

    // FAILED
    ErrorKind     error_kind{ErrorKind::IO_FAILURE};
    std::string   message;

    bool merged() const { return status == Status::MERGED; }
};

class MergeEngine {
public:
    MergeEngine(ChunkStore& store, ArtifactCatalog& catalog);

    MergeOutcome merge(const UploadSession& session);

private:
    ChunkStore&      store_;
    ArtifactCatalog& catalog_;
};
