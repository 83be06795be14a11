// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "batch.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

#include "training/vocab.h"

TokenTensor TokenTensor::filled(int len, int batch, int feats, int value) {
    TokenTensor t;
    t.Len = len;
    t.Batch = batch;
    t.Feats = feats;
    t.Ids.assign(static_cast<std::size_t>(len) * batch * feats, value);
    return t;
}

TokenTensor TokenTensor::first_features(int feats) const {
    feats = std::min(feats, Feats);
    TokenTensor out = filled(Len, Batch, feats, PAD_INDEX);
    for (int t = 0; t < Len; ++t) {
        for (int b = 0; b < Batch; ++b) {
            for (int f = 0; f < feats; ++f) out.at(t, b, f) = at(t, b, f);
        }
    }
    return out;
}

long Batch::num_tgt_tokens() const {
    long n = 0;
    for (int t = 1; t < Tgt.Len; ++t) {
        for (int b = 0; b < Tgt.Batch; ++b) {
            if (Tgt.at(t, b) != PAD_INDEX) ++n;
        }
    }
    return n;
}

long Batch::num_src_tokens() const {
    long n = 0;
    for (int len : SrcLengths) n += len;
    return n;
}

Batch make_batch(const std::vector<std::vector<int>>& src, const std::vector<std::vector<int>>& tgt,
                 int src_feats, int tgt_feats) {
    if (src.size() != tgt.size() || src.empty()) {
        throw std::invalid_argument(fmt::format("Cannot batch {} sources with {} targets", src.size(), tgt.size()));
    }
    const int batch = static_cast<int>(src.size());
    int src_len = 0;
    int tgt_len = 0;
    for (int b = 0; b < batch; ++b) {
        if (src[b].size() % src_feats != 0 || tgt[b].size() % tgt_feats != 0) {
            throw std::invalid_argument("Token sequence does not match the number of feature streams");
        }
        src_len = std::max(src_len, static_cast<int>(src[b].size()) / src_feats);
        tgt_len = std::max(tgt_len, static_cast<int>(tgt[b].size()) / tgt_feats);
    }

    Batch result;
    result.BatchSize = batch;
    result.Src = TokenTensor::filled(src_len, batch, src_feats, PAD_INDEX);
    result.Tgt = TokenTensor::filled(tgt_len, batch, tgt_feats, PAD_INDEX);
    result.SrcLengths.resize(batch);
    for (int b = 0; b < batch; ++b) {
        int len = static_cast<int>(src[b].size()) / src_feats;
        result.SrcLengths[b] = len;
        for (int t = 0; t < len; ++t) {
            for (int f = 0; f < src_feats; ++f) result.Src.at(t, b, f) = src[b][t * src_feats + f];
        }
        len = static_cast<int>(tgt[b].size()) / tgt_feats;
        for (int t = 0; t < len; ++t) {
            for (int f = 0; f < tgt_feats; ++f) result.Tgt.at(t, b, f) = tgt[b][t * tgt_feats + f];
        }
    }
    return result;
}
