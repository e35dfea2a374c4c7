#include "chunk_codec.hpp"
#include "spora/crypto.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <set>

using namespace spora;

namespace {

constexpr std::int64_t kMiB = 1024 * 1024;

template <typename E, typename F>
bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    log::set_level(log::Level::warning);

    const auto key = crypto::random_key();
    ChunkCodec codec(key);

    // 2.5 MiB at 1 MiB per chunk: 1 MiB, 1 MiB, 0.5 MiB.
    const Bytes data = test::pattern_bytes(static_cast<std::size_t>(kMiB * 5 / 2), 7);
    auto chunks = codec.split(data, kMiB);
    assert(chunks.size() == 3);
    assert(chunks[0].size == static_cast<std::uint64_t>(kMiB));
    assert(chunks[2].size == static_cast<std::uint64_t>(kMiB / 2));
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        assert(chunks[i].index == i);
        assert(chunks[i].iv.has_value());
        assert(chunks[i].auth_tag.has_value());
        assert(chunks[i].data.size() == chunks[i].size + crypto::kIvSize + crypto::kTagSize);
        assert(ChunkCodec::verify(chunks[i]));
    }
    assert(codec.assemble(chunks) == data);

    // Order of arrival does not matter.
    auto shuffled = chunks;
    std::reverse(shuffled.begin(), shuffled.end());
    assert(codec.assemble(shuffled) == data);

    // A single flipped bit is caught by the hash.
    {
        auto tampered = chunks;
        tampered[1].data[40] ^= 0x01;
        assert(!ChunkCodec::verify(tampered[1]));
        assert(throws<AssemblyError>([&] { codec.assemble(tampered); }));
    }

    // Tampering that also fixes up the hash is caught by GCM authentication.
    {
        auto tampered = chunks;
        tampered[0].data[crypto::kIvSize + 3] ^= 0x80;
        tampered[0].hash = crypto::sha256(tampered[0].data);
        assert(ChunkCodec::verify(tampered[0]));
        assert(throws<AssemblyError>([&] { codec.assemble(tampered); }));
    }

    // Missing and duplicate indices.
    {
        auto missing = chunks;
        missing.erase(missing.begin() + 1);
        assert(throws<AssemblyError>([&] { codec.assemble(missing); }));

        auto duplicate = chunks;
        duplicate.push_back(chunks[0]);
        assert(throws<AssemblyError>([&] { codec.assemble(duplicate); }));

        assert(throws<AssemblyError>([&] { codec.assemble({}); }));
    }

    // Fresh IV per chunk, even for identical plaintext.
    {
        const Bytes small = test::pattern_bytes(16, 1);
        constexpr std::size_t kSamples = 100000;
        std::set<std::string> ivs;
        for (std::size_t i = 0; i < kSamples; ++i) {
            const Chunk chunk = codec.encode_chunk(0, small.data(), small.size());
            assert(chunk.iv.has_value());
            ivs.insert(std::string(chunk.iv->begin(), chunk.iv->end()));
        }
        assert(ivs.size() == kSamples);

        const Bytes same = test::pattern_bytes(4096, 1);

        const auto a = codec.split(same, 1024);
        const auto b = codec.split(same, 1024);
        assert(a[0].hash != b[0].hash);
    }

    // Another key cannot open the chunks.
    {
        ChunkCodec other(crypto::random_key());
        assert(throws<AssemblyError>([&] { other.assemble(chunks); }));
    }

    // Rebuilding from a stored blob.
    {
        const Chunk& original = chunks[2];
        const Chunk rebuilt = ChunkCodec::from_blob(original.index, original.data, original.hash,
                                                    original.size, true);
        assert(rebuilt.iv == original.iv);
        assert(rebuilt.auth_tag == original.auth_tag);
        assert(codec.decode_chunk(rebuilt) == codec.decode_chunk(original));

        assert(throws<InvalidInputError>([&] {
            ChunkCodec::from_blob(0, Bytes(8, 0), original.hash, 0, true);
        }));
    }

    // Plain mode stores the bytes as they are.
    {
        ChunkCodec plain(key, false);
        const auto plain_chunks = plain.split(data, kMiB);
        assert(plain_chunks.size() == 3);
        assert(!plain_chunks[0].iv.has_value());
        assert(plain_chunks[0].data.size() == static_cast<std::size_t>(kMiB));
        assert(plain.assemble(plain_chunks) == data);
    }

    // Small input yields one short chunk.
    {
        const Bytes tiny{1, 2, 3};
        const auto one = codec.split(tiny, kMiB);
        assert(one.size() == 1);
        assert(one[0].size == 3);
        assert(codec.assemble(one) == tiny);
    }

    // Invalid input.
    assert(throws<InvalidInputError>([&] { codec.split(Bytes{}, kMiB); }));
    assert(throws<InvalidInputError>([&] { codec.split(data, 0); }));
    assert(throws<InvalidInputError>([&] { codec.split(data, -5); }));

    return 0;
}
