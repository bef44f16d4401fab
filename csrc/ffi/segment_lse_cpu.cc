// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/*
 * CPU implementation of the fused segment log-sum-exp with custom VJP.
 *
 * Forward Pass:
 *   For offsets secs[S+1] over L entries:
 *     out_s = log Σ_{j∈s} m_j exp(ℓ_j)
 *   evaluated as μ_s + log Σ m_j exp(ℓ_j − μ_s), μ_s = max Re ℓ_j.
 *   Empty segments yield -inf.
 *
 * Backward Pass:
 *   grad_ℓ_j = cot_s · m_j exp(ℓ_j − out_s) for j in segment s, 0 elsewhere.
 *
 * File: csrc/ffi/segment_lse_cpu.cc
 */

#include <cstdint>
#include <string>
#include "xla/ffi/api/c_api.h"
#include "xla/ffi/api/ffi.h"

#include <qsr/grad/segment_ops.hpp>

namespace ffi = xla::ffi;

// ============================================================================
// Helper Functions
// ============================================================================

static inline ffi::Error InvalidArg(const std::string& msg) {
  return ffi::Error(ffi::ErrorCode::kInvalidArgument, msg);
}

template <typename Buf>
static inline ffi::Error ValidateVector(Buf& a, int64_t& n, const char* name) {
  auto dims = a.dimensions();
  if (dims.size() != 1) return InvalidArg(std::string(name) + " must be rank-1");
  n = dims[0];
  return ffi::Error::Success();
}

// Offsets must start at >= 0, be non-decreasing and end within [0, L]
static ffi::Error ValidateOffsets(const int64_t* secs, int64_t n_offsets, int64_t L) {
  if (n_offsets < 1) return InvalidArg("secs must have at least one entry");
  if (secs[0] < 0) return InvalidArg("secs[0] must be non-negative");
  for (int64_t s = 1; s < n_offsets; ++s) {
    if (secs[s] < secs[s - 1]) return InvalidArg("secs must be non-decreasing");
  }
  if (secs[n_offsets - 1] > L) return InvalidArg("secs exceeds log_psi length");
  return ffi::Error::Success();
}

// ============================================================================
// Forward Pass
// ============================================================================

template <ffi::DataType DT>
static ffi::Error SegmentLseForward(ffi::Buffer<DT> log_psi,
                                    ffi::Buffer<DT> mels,
                                    ffi::Buffer<ffi::DataType::S64> secs,
                                    ffi::ResultBuffer<DT> out) {
  using T = ffi::NativeType<DT>;
  using R = typename T::value_type;
  int64_t L = 0, Lm = 0, n_offsets = 0, S = 0;

  if (auto err = ValidateVector(log_psi, L, "log_psi"); err.failure()) return err;
  if (auto err = ValidateVector(mels, Lm, "mels"); err.failure()) return err;
  if (auto err = ValidateVector(secs, n_offsets, "secs"); err.failure()) return err;
  if (L != Lm) return InvalidArg("log_psi and mels must have equal length");
  if (auto err = ValidateVector(*out, S, "out"); err.failure()) return err;
  if (S != n_offsets - 1) return InvalidArg("out must have shape [S] for secs of shape [S+1]");

  const T* lp = log_psi.typed_data();
  const T* m = mels.typed_data();
  const int64_t* off = secs.typed_data();
  T* o = out->typed_data();

  if (auto err = ValidateOffsets(off, n_offsets, L); err.failure()) return err;

  qsr::kernels::segment_lse_forward<R>(lp, m, off, S, o);
  return ffi::Error::Success();
}

// ============================================================================
// Backward Pass
// ============================================================================

template <ffi::DataType DT>
static ffi::Error SegmentLseBackward(ffi::Buffer<DT> log_psi,
                                     ffi::Buffer<DT> mels,
                                     ffi::Buffer<ffi::DataType::S64> secs,
                                     ffi::Buffer<DT> cot,
                                     ffi::ResultBuffer<DT> grad) {
  using T = ffi::NativeType<DT>;
  using R = typename T::value_type;
  int64_t L = 0, Lm = 0, n_offsets = 0, S = 0, Lg = 0;

  if (auto err = ValidateVector(log_psi, L, "log_psi"); err.failure()) return err;
  if (auto err = ValidateVector(mels, Lm, "mels"); err.failure()) return err;
  if (auto err = ValidateVector(secs, n_offsets, "secs"); err.failure()) return err;
  if (auto err = ValidateVector(cot, S, "cot"); err.failure()) return err;
  if (auto err = ValidateVector(*grad, Lg, "grad"); err.failure()) return err;
  if (L != Lm || L != Lg) return InvalidArg("log_psi, mels and grad must have equal length");
  if (S != n_offsets - 1) return InvalidArg("cot must have shape [S] for secs of shape [S+1]");

  const T* lp = log_psi.typed_data();
  const T* m = mels.typed_data();
  const int64_t* off = secs.typed_data();
  const T* c = cot.typed_data();
  T* g = grad->typed_data();

  if (auto err = ValidateOffsets(off, n_offsets, L); err.failure()) return err;

  qsr::kernels::segment_lse_backward<R>(lp, m, off, S, c, L, g);
  return ffi::Error::Success();
}

// ============================================================================
// Handler Registration
// ============================================================================

XLA_FFI_DEFINE_HANDLER_SYMBOL(
    qsr_segment_lse_c128_fwd_cpu, SegmentLseForward<ffi::DataType::C128>,
    ffi::Ffi::Bind()
        .Arg<ffi::Buffer<ffi::DataType::C128>>()
        .Arg<ffi::Buffer<ffi::DataType::C128>>()
        .Arg<ffi::Buffer<ffi::DataType::S64>>()
        .Ret<ffi::Buffer<ffi::DataType::C128>>());

XLA_FFI_DEFINE_HANDLER_SYMBOL(
    qsr_segment_lse_c128_bwd_cpu, SegmentLseBackward<ffi::DataType::C128>,
    ffi::Ffi::Bind()
        .Arg<ffi::Buffer<ffi::DataType::C128>>()
        .Arg<ffi::Buffer<ffi::DataType::C128>>()
        .Arg<ffi::Buffer<ffi::DataType::S64>>()
        .Arg<ffi::Buffer<ffi::DataType::C128>>()
        .Ret<ffi::Buffer<ffi::DataType::C128>>());

XLA_FFI_DEFINE_HANDLER_SYMBOL(
    qsr_segment_lse_c64_fwd_cpu, SegmentLseForward<ffi::DataType::C64>,
    ffi::Ffi::Bind()
        .Arg<ffi::Buffer<ffi::DataType::C64>>()
        .Arg<ffi::Buffer<ffi::DataType::C64>>()
        .Arg<ffi::Buffer<ffi::DataType::S64>>()
        .Ret<ffi::Buffer<ffi::DataType::C64>>());

XLA_FFI_DEFINE_HANDLER_SYMBOL(
    qsr_segment_lse_c64_bwd_cpu, SegmentLseBackward<ffi::DataType::C64>,
    ffi::Ffi::Bind()
        .Arg<ffi::Buffer<ffi::DataType::C64>>()
        .Arg<ffi::Buffer<ffi::DataType::C64>>()
        .Arg<ffi::Buffer<ffi::DataType::S64>>()
        .Arg<ffi::Buffer<ffi::DataType::C64>>()
        .Ret<ffi::Buffer<ffi::DataType::C64>>());
