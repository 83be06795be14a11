// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for vocabulary subsetting, bias migration and checkpoint vocabulary swaps.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fstream>
#include <map>
#include <string>
#include <vector>

#include "models/nmt_model.h"
#include "models/vocab_migration.h"
#include "models/weight_mapping.h"
#include "training/checkpoint.h"
#include "training/logging.h"
#include "training/vocab.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

using Catch::Approx;
using namespace testing_utils;

namespace {

const std::string SRC_LUT = "encoder.embeddings.word_lut.weight";
const std::string TGT_LUT = "decoder.embeddings.word_lut.weight";

//! specials, "en@a", "fr@b"
Vocab tagged_vocab() {
    return build_vocab({{"en@a", 5}, {"fr@b", 3}}, default_specials());
}

Tensor iota_bias(long n) {
    Tensor bias = Tensor::zeros({n});
    for (long i = 0; i < n; ++i) bias[i] = 0.1f * static_cast<float>(i + 1);
    return bias;
}

//! Checkpoint of a model trained with tagged_vocab() on both sides, hidden size @p dim.
Checkpoint tagged_checkpoint(long dim) {
    Checkpoint checkpoint;
    checkpoint.Step = 40;
    checkpoint.Model = small_model_options();
    checkpoint.Model.ShareEmbeddings = true;
    checkpoint.Vocab.Src.Words = tagged_vocab();
    checkpoint.Vocab.Tgt.Words = tagged_vocab();
    checkpoint.ModelState.emplace(SRC_LUT, random_tensor({6, dim}, 1));
    checkpoint.ModelState.emplace(TGT_LUT, random_tensor({6, dim}, 2));
    checkpoint.ModelState.emplace(models::OUTPUT_EMBEDDING_NAME, random_tensor({6, dim}, 3));
    checkpoint.Generator.emplace("proj.weight", random_tensor({6, dim}, 4));
    checkpoint.Generator.emplace("proj.bias", iota_bias(6));
    return checkpoint;
}

} // namespace

TEST_CASE("subset_target_language keeps the language and the specials", "[migration]") {
    VocabularySet vocab;
    vocab.Src.Words = make_words(3);
    vocab.Tgt.Words = build_vocab({{"en@hello", 2}, {"fr@bonjour", 3}}, default_specials());
    vocab.Tgt.Words.Vectors = random_tensor({6, 4}, 5);
    REQUIRE(vocab.Tgt.Words.lookup("fr@bonjour") == 4);
    REQUIRE(vocab.Tgt.Words.lookup("en@hello") == 5);

    VocabularySet subset = models::subset_target_language(vocab, "en", TensorMap{});
    const Vocab& tgt = subset.Tgt.Words;
    REQUIRE(tgt.Itos == std::vector<std::string>{UNK_WORD, PAD_WORD, BOS_WORD, EOS_WORD, "en@hello"});
    REQUIRE_FALSE(tgt.contains("fr@bonjour"));
    REQUIRE(tgt.Freqs.at("en@hello") == 2);
    REQUIRE(tgt.Freqs.count("fr@bonjour") == 0);

    REQUIRE(tgt.Vectors.rows() == 5);
    for (long c = 0; c < 4; ++c) {
        REQUIRE(tgt.Vectors.row(4)[c] == vocab.Tgt.Words.Vectors.row(5)[c]);
        REQUIRE(tgt.Vectors.row(BOS_INDEX)[c] == vocab.Tgt.Words.Vectors.row(BOS_INDEX)[c]);
    }
    REQUIRE(subset.Src.Words.Itos == vocab.Src.Words.Itos);
}

TEST_CASE("language subset takes its vectors from the trained decoder table", "[migration]") {
    Checkpoint checkpoint = tagged_checkpoint(4);
    const Tensor& lut = checkpoint.ModelState.at(TGT_LUT);
    REQUIRE_FALSE(checkpoint.Vocab.Tgt.Words.has_vectors());

    SECTION("current key") {
        const Vocab tgt = models::subset_target_language(checkpoint.Vocab, "fr", checkpoint.ModelState).Tgt.Words;
        REQUIRE(tgt.Itos == std::vector<std::string>{UNK_WORD, PAD_WORD, BOS_WORD, EOS_WORD, "fr@b"});
        REQUIRE(tgt.Vectors.rows() == 5);
        REQUIRE(tgt.Vectors.row_size() == 4);
        const int old_index = checkpoint.Vocab.Tgt.Words.lookup("fr@b");
        for (long c = 0; c < 4; ++c) {
            REQUIRE(tgt.Vectors.row(4)[c] == lut.row(old_index)[c]);
            REQUIRE(tgt.Vectors.row(EOS_INDEX)[c] == lut.row(EOS_INDEX)[c]);
        }
    }
    SECTION("legacy key") {
        TensorMap legacy;
        legacy.emplace("decoder.embeddings.make_embedding.emb_luts.0.0.weight", lut);
        const Vocab tgt = models::subset_target_language(checkpoint.Vocab, "en", legacy).Tgt.Words;
        REQUIRE(tgt.Vectors.rows() == 5);
        REQUIRE(tgt.Vectors.row(4)[0] == lut.row(checkpoint.Vocab.Tgt.Words.lookup("en@a"))[0]);
    }
    SECTION("a detached table falls back to the vocabulary vectors") {
        TensorMap detached;
        detached.emplace(TGT_LUT, random_tensor({2, 4}, 21));
        VocabularySet vocab = checkpoint.Vocab;
        vocab.Tgt.Words.Vectors = random_tensor({6, 4}, 22);
        const Vocab tgt = models::subset_target_language(vocab, "en", detached).Tgt.Words;
        REQUIRE(tgt.Vectors.row(4)[1] == vocab.Tgt.Words.Vectors.row(vocab.Tgt.Words.lookup("en@a"))[1]);
    }
    SECTION("no table and no vectors") {
        REQUIRE_THROWS_AS(models::subset_target_language(checkpoint.Vocab, "en", TensorMap{}), migration_error);
    }
}

TEST_CASE("language-filtered bias keeps the language entries", "[migration]") {
    const Vocab old_vocab = tagged_vocab();
    const Tensor old_bias = iota_bias(6);

    SECTION("subset of the old vocabulary") {
        VocabularySet set;
        set.Tgt.Words = old_vocab;
        const Vocab new_vocab = models::subset_target_language(set, "en", tagged_checkpoint(4).ModelState).Tgt.Words;
        Tensor bias = models::migrate_bias(old_bias, new_vocab, &old_vocab, EBiasPolicy::LANGUAGE_FILTERED, "en");
        REQUIRE(bias.nelem() == 5);
        for (long i = 0; i < 5; ++i) {
            REQUIRE(bias[i] == Approx(old_bias[i]));
        }
    }

    SECTION("re-indexed into a new order") {
        const Vocab new_vocab = build_vocab({{"en@c", 9}, {"en@a", 4}, {"plain", 2}, {"fr@b", 1}}, default_specials());
        REQUIRE(new_vocab.Itos[4] == "en@c");
        REQUIRE(new_vocab.Itos[5] == "en@a");
        Tensor bias = models::migrate_bias(old_bias, new_vocab, &old_vocab, EBiasPolicy::LANGUAGE_FILTERED, "en");
        REQUIRE(bias.nelem() == static_cast<std::size_t>(new_vocab.size()));
        for (int i = 0; i < NUM_SPECIALS; ++i) {
            REQUIRE(bias[i] == Approx(old_bias[i]));
        }
        REQUIRE(bias[4] == 0.f);
        REQUIRE(bias[5] == Approx(old_bias[4]));
        REQUIRE(bias[new_vocab.lookup("plain")] == 0.f);
        REQUIRE(bias[new_vocab.lookup("fr@b")] == 0.f);
    }

    SECTION("the old vocabulary is required") {
        REQUIRE_THROWS_AS(models::migrate_bias(old_bias, old_vocab, nullptr, EBiasPolicy::LANGUAGE_FILTERED, "en"),
                          migration_error);
    }
}

TEST_CASE("zero and drop bias policies", "[migration]") {
    const Vocab old_vocab = tagged_vocab();
    const Tensor old_bias = iota_bias(6);
    const Vocab new_vocab = make_words(5);

    Tensor zeroed = models::migrate_bias(old_bias, new_vocab, nullptr, EBiasPolicy::ZERO_EXCEPT_SPECIALS, "");
    REQUIRE(zeroed.nelem() == static_cast<std::size_t>(new_vocab.size()));
    for (long i = 0; i < new_vocab.size(); ++i) {
        if (i < NUM_SPECIALS) {
            REQUIRE(zeroed[i] == Approx(old_bias[i]));
        } else {
            REQUIRE(zeroed[i] == 0.f);
        }
    }

    Tensor dropped = models::migrate_bias(old_bias, new_vocab, &old_vocab, EBiasPolicy::DROP, "");
    REQUIRE_FALSE(dropped.has_value());
}

TEST_CASE("migrate_vocabulary rewrites tables, generator and options", "[migration]") {
    const long dim = 4;
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    Checkpoint checkpoint = tagged_checkpoint(dim);
    const VocabularySet old_vocab = checkpoint.Vocab;
    const Tensor src_lut = checkpoint.ModelState.at(SRC_LUT);

    VocabularySet with_vectors = old_vocab;
    with_vectors.Tgt.Words.Vectors = random_tensor({6, dim}, 8);
    VocabularySet new_vocab = models::subset_target_language(with_vectors, "en", checkpoint.ModelState);

    TrainingOptions training;
    training.BiasPolicy = EBiasPolicy::LANGUAGE_FILTERED;
    training.Langcode = "en";
    Checkpoint migrated = models::migrate_vocabulary(new_vocab, checkpoint, training, &old_vocab, logger);

    REQUIRE(migrated.Vocab.Tgt.Words.size() == 5);
    REQUIRE(migrated.ModelState.at(TGT_LUT).Data == new_vocab.Tgt.Words.Vectors.Data);
    REQUIRE(migrated.Generator.at("proj.weight").Data == new_vocab.Tgt.Words.Vectors.Data);
    REQUIRE(migrated.Generator.at("proj.bias").nelem() == 5);
    // the source side has no new vectors and stays as it was
    REQUIRE(migrated.ModelState.at(SRC_LUT).Data == src_lut.Data);
    REQUIRE_FALSE(migrated.Model.ShareEmbeddings);
    REQUIRE(migrated.ModelState.count(models::OUTPUT_EMBEDDING_NAME) == 0);
    REQUIRE(migrated.Step == 40);
}

TEST_CASE("migrate_vocabulary with the drop policy removes the bias", "[migration]") {
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    Checkpoint checkpoint = tagged_checkpoint(4);
    VocabularySet new_vocab = checkpoint.Vocab;
    new_vocab.Tgt.Words.Vectors = random_tensor({6, 4}, 9);

    TrainingOptions training;
    training.BiasPolicy = EBiasPolicy::DROP;
    Checkpoint migrated = models::migrate_vocabulary(new_vocab, checkpoint, training, nullptr, logger);
    REQUIRE(migrated.Generator.count("proj.bias") == 0);
    REQUIRE(migrated.Generator.count("proj.weight") == 1);
}

TEST_CASE("migrate_vocabulary rejects unusable vocabularies", "[migration]") {
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    TrainingOptions training;
    training.BiasPolicy = EBiasPolicy::ZERO_EXCEPT_SPECIALS;

    SECTION("no target vectors") {
        Checkpoint checkpoint = tagged_checkpoint(4);
        VocabularySet new_vocab = checkpoint.Vocab;
        REQUIRE_THROWS_AS(models::migrate_vocabulary(new_vocab, checkpoint, training, nullptr, logger), migration_error);
    }
    SECTION("vectors of the wrong dimension") {
        Checkpoint checkpoint = tagged_checkpoint(4);
        VocabularySet new_vocab = checkpoint.Vocab;
        new_vocab.Tgt.Words.Vectors = random_tensor({6, 3}, 9);
        REQUIRE_THROWS_AS(models::migrate_vocabulary(new_vocab, checkpoint, training, nullptr, logger), migration_error);
    }
    SECTION("language filter without the old vocabulary") {
        Checkpoint checkpoint = tagged_checkpoint(4);
        VocabularySet new_vocab = checkpoint.Vocab;
        new_vocab.Tgt.Words.Vectors = random_tensor({6, 4}, 9);
        training.BiasPolicy = EBiasPolicy::LANGUAGE_FILTERED;
        training.Langcode = "en";
        REQUIRE_THROWS_AS(models::migrate_vocabulary(new_vocab, checkpoint, training, nullptr, logger), migration_error);
    }
}

TEST_CASE("set_vocab_from_embeddings replaces one side", "[migration]") {
    ScratchDir dir("embeddings");
    const std::string file = dir.file("vectors.txt");
    {
        std::ofstream out(file);
        out << "2 3\n";
        out << "hello 1 2 3\n";
        out << "world 4 5 6\n";
    }

    VocabularySet vocab;
    vocab.Src.Words = make_words(4);
    vocab.Tgt.Words = make_words(4);
    TensorMap state;
    state.emplace(SRC_LUT, random_tensor({8, 3}, 12));

    models::set_vocab_from_embeddings(vocab, "src", file, state);
    const Vocab& src = vocab.Src.Words;
    REQUIRE(src.Itos == std::vector<std::string>{UNK_WORD, PAD_WORD, BOS_WORD, EOS_WORD, "hello", "world"});
    REQUIRE(src.Vectors.rows() == 6);
    for (long c = 0; c < 3; ++c) {
        REQUIRE(src.Vectors.row(PAD_INDEX)[c] == state.at(SRC_LUT).row(PAD_INDEX)[c]);
    }
    REQUIRE(src.Vectors.row(4)[0] == 1.f);
    REQUIRE(src.Vectors.row(5)[2] == 6.f);
    REQUIRE(vocab.Tgt.Words.size() == 8);

    REQUIRE_THROWS_AS(models::set_vocab_from_embeddings(vocab, "middle", file, state), migration_error);
    REQUIRE_THROWS_AS(models::set_vocab_from_embeddings(vocab, "tgt", dir.file("missing.txt"), state), migration_error);
}

TEST_CASE("migration renames legacy keys before replacing the tables", "[migration]") {
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    Checkpoint checkpoint = tagged_checkpoint(4);
    const std::string legacy_key = "decoder.embeddings.make_embedding.emb_luts.0.0.weight";
    checkpoint.ModelState.emplace(legacy_key, checkpoint.ModelState.at(TGT_LUT));
    checkpoint.ModelState.erase(TGT_LUT);

    const VocabularySet old_vocab = checkpoint.Vocab;
    VocabularySet new_vocab = models::subset_target_language(old_vocab, "en", checkpoint.ModelState);
    TrainingOptions training;
    training.BiasPolicy = EBiasPolicy::ZERO_EXCEPT_SPECIALS;
    Checkpoint migrated = models::migrate_vocabulary(new_vocab, checkpoint, training, &old_vocab, logger);

    REQUIRE(migrated.ModelState.count(legacy_key) == 0);
    REQUIRE(migrated.ModelState.at(TGT_LUT).Data == new_vocab.Tgt.Words.Vectors.Data);
    // nothing is left for a later fix-up to rename over the new table
    TensorMap state = migrated.ModelState;
    REQUIRE(models::fix_state_dict_keys(state) == 0);
    REQUIRE(state.at(TGT_LUT).Data == new_vocab.Tgt.Words.Vectors.Data);
}
