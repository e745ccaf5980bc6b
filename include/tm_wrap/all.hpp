// tm_wrap/all.hpp
// Umbrella header for TsetlinWrap
//
// Include this single header to get all wrapper functionality.

#pragma once

#include "tm_wrap/error.hpp"
#include "tm_wrap/log.hpp"
#include "tm_wrap/config.hpp"
#include "tm_wrap/engine.hpp"
#include "tm_wrap/matrix.hpp"
#include "tm_wrap/model.hpp"
#include "tm_wrap/raw_codec.hpp"
#include "tm_wrap/fbs_codec.hpp"
#include "tm_wrap/model_size.hpp"
#include "tm_wrap/classifier.hpp"

// ============================================================================
// TsetlinWrap - Quick Reference
// ============================================================================
//
// CORE CLASSES:
// ─────────────────────────────────────────────────────────────────────────────
//   tm_wrap::Classifier<Label>        - dense engine (tm_*)
//   tm_wrap::SparseClassifier<Label>  - sparse engine (stm_*)
//   tm_wrap::Engine                   - loaded engine library + capabilities
//   tm_wrap::NativeHandle             - move-only owner of one native model
//   tm_wrap::LabelMapping<Label>      - labels <-> indices 0..C-1 (ascending)
//   tm_wrap::BinaryMatrix(View)       - row-major 0/1 input
//
// MODEL FILES:
// ─────────────────────────────────────────────────────────────────────────────
//   ModelFormat::RawBinary       - fixed 32-byte header + int16 weights + int8 states
//   ModelFormat::SelfDescribing  - FlatBuffers, shapes + optional literal names
//
// ERRORS:
// ─────────────────────────────────────────────────────────────────────────────
//   LinkError, ValidationError, NotFittedError, UnsupportedOperation,
//   FormatError - all derive from tm_wrap::Error (a std::runtime_error)
//
// EXAMPLE:
// ─────────────────────────────────────────────────────────────────────────────
//   tm_wrap::EngineConfig cfg{.lib_dir = "/opt/tsetlin/lib"};
//   tm_wrap::Classifier<int> clf(tm_wrap::Hyperparameters{}.with_num_clauses(200), cfg);
//   clf.fit(X, y);
//   auto pred = clf.predict(X);
//   clf.save_model("model.bin");
//
// ============================================================================
