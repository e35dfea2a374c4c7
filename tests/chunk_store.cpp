#include "chunk_store.hpp"
#include "spora/crypto.hpp"
#include "spora/errors.hpp"
#include "spora/hex.hpp"
#include "spora/log.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>

using namespace spora;
namespace fs = std::filesystem;

int main() {
    log::set_level(log::Level::error);

    // In memory.
    {
        ChunkStore store(100);
        const Bytes blob = test::pattern_bytes(60);
        assert(store.put("file_a.0", blob));
        assert(store.contains("file_a.0"));
        assert(store.used_bytes() == 60);
        assert(store.available_bytes() == 40);
        assert(*store.get("file_a.0") == blob);

        // Does not fit.
        assert(!store.put("file_a.1", test::pattern_bytes(41)));
        assert(!store.contains("file_a.1"));

        // Overwrite accounts for the previous blob.
        assert(store.put("file_a.0", test::pattern_bytes(90)));
        assert(store.used_bytes() == 90);

        const Bytes nonce = crypto::random_bytes(crypto::kNonceSize);
        const auto proof = store.prove("file_a.0", nonce);
        assert(proof.has_value());
        assert(*proof == crypto::proof_digest(*store.get("file_a.0"), nonce));
        assert(!store.prove("file_a.7", nonce).has_value());

        assert(store.erase("file_a.0"));
        assert(!store.erase("file_a.0"));
        assert(store.used_bytes() == 0);
        assert(!store.get("file_a.0").has_value());

        bool threw = false;
        try {
            store.put("../escape", blob);
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);
        assert(!ChunkStore::valid_chunk_id(""));
        assert(!ChunkStore::valid_chunk_id(".."));
        assert(!ChunkStore::valid_chunk_id("a/b"));
        assert(ChunkStore::valid_chunk_id("file_0123abcd.12"));
    }

    // On disk.
    {
        const fs::path dir = fs::temp_directory_path() /
                             ("spora_chunk_store_" + hex::encode(crypto::random_bytes(6)));
        {
            ChunkStore store(1 << 20, dir.string());
            assert(store.load_existing() == 0);
            assert(store.put("file_b.0", test::pattern_bytes(1000, 1)));
            assert(store.put("file_b.1", test::pattern_bytes(500, 2)));
            assert(store.put("file_b.2", test::pattern_bytes(10, 3)));
            assert(store.erase("file_b.2"));
            assert(fs::exists(dir / "file_b.0.chunk"));
            assert(!fs::exists(dir / "file_b.2.chunk"));
        }

        // Unrelated files are ignored.
        {
            std::ofstream stray((dir / "notes.txt").string());
            stray << "not a chunk";
        }

        ChunkStore reopened(1 << 20, dir.string());
        assert(reopened.load_existing() == 2);
        assert(reopened.size() == 2);
        assert(reopened.used_bytes() == 1500);
        assert(*reopened.get("file_b.0") == test::pattern_bytes(1000, 1));
        assert(*reopened.get("file_b.1") == test::pattern_bytes(500, 2));
        const auto ids = reopened.chunk_ids();
        assert(ids.size() == 2 && ids[0] == "file_b.0" && ids[1] == "file_b.1");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    return 0;
}
