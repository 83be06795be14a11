// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for vocabularies, batching and the parallel corpus loader.

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "training/batch.h"
#include "training/dataloader.h"
#include "training/vocab.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

using namespace testing_utils;

namespace {

void write_lines(const std::string& file_name, const std::vector<std::string>& lines) {
    std::ofstream out(file_name);
    for (const auto& line : lines) out << line << "\n";
}

VocabularySet abc_vocab() {
    VocabularySet vocab;
    vocab.Src.Words = build_vocab({{"a", 3}, {"b", 2}, {"c", 1}}, default_specials());
    vocab.Tgt.Words = build_vocab({{"x", 3}, {"y", 2}, {"z", 1}}, default_specials());
    return vocab;
}

} // namespace

TEST_CASE("vocabulary order and lookup", "[vocab]") {
    Vocab vocab = build_vocab({{"b", 5}, {"a", 5}, {"c", 9}, {"rare", 1}}, default_specials(), 0, 2);
    REQUIRE(vocab.Itos == std::vector<std::string>{UNK_WORD, PAD_WORD, BOS_WORD, EOS_WORD, "c", "a", "b"});
    REQUIRE(vocab.lookup("a") == 5);
    REQUIRE(vocab.lookup("rare") == UNK_INDEX);
    REQUIRE(vocab.lookup(PAD_WORD) == PAD_INDEX);
    REQUIRE_FALSE(vocab.contains("rare"));

    Vocab limited = build_vocab({{"b", 5}, {"a", 5}, {"c", 9}}, default_specials(), 1);
    REQUIRE(limited.size() == NUM_SPECIALS + 1);

    vocab.Stoi.emplace("<UNK>", UNK_INDEX);
    REQUIRE(vocab.prune_unknown_aliases() == 1);
    REQUIRE(vocab.contains(UNK_WORD));
    REQUIRE_FALSE(vocab.contains("<UNK>"));
}

TEST_CASE("vocabulary files keep tokens and vectors", "[vocab]") {
    ScratchDir dir("vocab");
    VocabularySet vocab = make_vocab(5, 3);
    save_vocab_file(vocab, dir.file("vocab.pt"));

    VocabularySet loaded = load_vocab_file(dir.file("vocab.pt"));
    REQUIRE(loaded.Src.Words.Itos == vocab.Src.Words.Itos);
    REQUIRE(loaded.Tgt.Words.lookup("w3") == vocab.Tgt.Words.lookup("w3"));
    REQUIRE(loaded.Tgt.Words.Vectors.Data == vocab.Tgt.Words.Vectors.Data);
    REQUIRE(loaded.Src.Words.Freqs == vocab.Src.Words.Freqs);

    REQUIRE_THROWS_AS(side_vocab(vocab, "both"), migration_error);
}

TEST_CASE("make_batch pads time-major", "[batch]") {
    Batch batch = make_batch({{10, 11, 12}, {20}}, {{BOS_INDEX, 5, EOS_INDEX}, {BOS_INDEX, 6, 7, EOS_INDEX}});
    REQUIRE(batch.BatchSize == 2);
    REQUIRE(batch.Src.Len == 3);
    REQUIRE(batch.SrcLengths == std::vector<int>{3, 1});
    REQUIRE(batch.Src.at(1, 0) == 11);
    REQUIRE(batch.Src.at(1, 1) == PAD_INDEX);
    REQUIRE(batch.Tgt.Len == 4);
    REQUIRE(batch.Tgt.at(3, 0) == PAD_INDEX);
    REQUIRE(batch.Tgt.at(3, 1) == EOS_INDEX);
    // <s> is not counted
    REQUIRE(batch.num_tgt_tokens() == 5);
    REQUIRE(batch.num_src_tokens() == 4);

    REQUIRE_THROWS_AS(make_batch({{1}}, {}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_batch({{1, 2, 3}}, {{BOS_INDEX, EOS_INDEX}}, 2), std::invalid_argument);
}

TEST_CASE("feature streams are split and kept", "[batch]") {
    Batch batch = make_batch({{10, 100, 11, 101}}, {{BOS_INDEX, 0, 5, 7, EOS_INDEX, 0}}, 2, 2);
    REQUIRE(batch.Src.Feats == 2);
    REQUIRE(batch.Src.Len == 2);
    REQUIRE(batch.Src.at(1, 0, 1) == 101);
    TokenTensor words = batch.Tgt.first_features(1);
    REQUIRE(words.Feats == 1);
    REQUIRE(words.Ids == std::vector<int>{BOS_INDEX, 5, EOS_INDEX});
}

TEST_CASE("in-memory batches repeat on request", "[dataloader]") {
    auto batches = make_batches(2, 4);
    InMemoryBatchSource once(batches, false);
    REQUIRE(once.next().has_value());
    REQUIRE(once.next().has_value());
    REQUIRE_FALSE(once.next().has_value());
    once.reset();
    REQUIRE(once.next().has_value());

    InMemoryBatchSource forever(batches, true);
    for (int i = 0; i < 5; ++i) REQUIRE(forever.next().has_value());
}

TEST_CASE("parallel corpus is encoded, framed and sharded", "[dataloader]") {
    ScratchDir dir("corpus");
    const std::string src = dir.file("train.src");
    const std::string tgt = dir.file("train.tgt");
    write_lines(src, {"a b", "c", "", "a q", "b", "c c"});
    write_lines(tgt, {"x", "y z", "x", "z", "y", "x y"});
    const VocabularySet vocab = abc_vocab();

    SECTION("single worker") {
        ParallelTextLoader loader(src, tgt, vocab, 2, 0, 1, false, 3);
        // the pair with an empty source side is dropped
        REQUIRE(loader.num_examples() == 5);
        REQUIRE(loader.batches_per_epoch() == 3);

        long sentences = 0;
        bool saw_unknown = false;
        while (auto batch = loader.next()) {
            sentences += batch->BatchSize;
            for (int b = 0; b < batch->BatchSize; ++b) {
                REQUIRE(batch->Tgt.at(0, b) == BOS_INDEX);
                for (int t = 0; t < batch->SrcLengths[b]; ++t) {
                    saw_unknown = saw_unknown || batch->Src.at(t, b) == UNK_INDEX;
                }
            }
        }
        REQUIRE(sentences == 5);
        REQUIRE(saw_unknown);
    }

    SECTION("two workers see disjoint batches of equal count") {
        ParallelTextLoader first(src, tgt, vocab, 2, 0, 2, false, 3);
        ParallelTextLoader second(src, tgt, vocab, 2, 1, 2, false, 3);
        REQUIRE(first.batches_per_epoch() == 1);
        REQUIRE(second.batches_per_epoch() == 1);

        auto a = first.next();
        auto b = second.next();
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE_FALSE(first.next().has_value());
        REQUIRE_FALSE(second.next().has_value());
        REQUIRE(a->Src.Ids != b->Src.Ids);
    }

    SECTION("repeating loaders start a new epoch") {
        ParallelTextLoader loader(src, tgt, vocab, 2, 0, 1, true, 3);
        for (std::size_t i = 0; i < loader.batches_per_epoch(); ++i) REQUIRE(loader.next().has_value());
        REQUIRE(loader.epoch() == 0);
        REQUIRE(loader.next().has_value());
        REQUIRE(loader.epoch() == 1);
    }

    SECTION("invalid setups") {
        write_lines(dir.file("short.tgt"), {"x"});
        REQUIRE_THROWS_AS(ParallelTextLoader(src, dir.file("short.tgt"), vocab, 2, 0, 1, false), std::runtime_error);
        REQUIRE_THROWS_AS(ParallelTextLoader(src, tgt, vocab, 0, 0, 1, false), std::invalid_argument);
        REQUIRE_THROWS_AS(ParallelTextLoader(src, tgt, vocab, 2, 2, 2, false), std::invalid_argument);
        REQUIRE_THROWS_AS(ParallelTextLoader(dir.file("missing.src"), tgt, vocab, 2, 0, 1, false), std::runtime_error);
    }
}
