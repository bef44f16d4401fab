// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * FFI module registration for JAX XLA custom calls.
 *
 * Exposes the fused segment log-sum-exp (forward/backward) to JAX
 * via XLA FFI on the CPU backend.
 *
 * File: csrc/ffi/ffi_module.cpp
 */

#include <type_traits>

#include "nanobind/nanobind.h"
#include "xla/ffi/api/c_api.h"

namespace nb = nanobind;

// Wraps XLA FFI handler into Python capsule for registration
template <typename T>
static nb::capsule EncapsulateFfiCall(T* fn) {
  static_assert(std::is_invocable_r_v<XLA_FFI_Error*, T, XLA_FFI_CallFrame*>,
                "Function must be an XLA FFI handler");
  return nb::capsule(reinterpret_cast<void*>(fn));
}

extern "C" {

// CPU handlers for complex128
XLA_FFI_Error* qsr_segment_lse_c128_fwd_cpu(XLA_FFI_CallFrame*);
XLA_FFI_Error* qsr_segment_lse_c128_bwd_cpu(XLA_FFI_CallFrame*);

// CPU handlers for complex64
XLA_FFI_Error* qsr_segment_lse_c64_fwd_cpu(XLA_FFI_CallFrame*);
XLA_FFI_Error* qsr_segment_lse_c64_bwd_cpu(XLA_FFI_CallFrame*);

}  // extern "C"

NB_MODULE(_qsr_ffi, m) {
  m.def("segment_lse_c128_fwd_cpu",
        []() { return EncapsulateFfiCall(qsr_segment_lse_c128_fwd_cpu); });
  m.def("segment_lse_c128_bwd_cpu",
        []() { return EncapsulateFfiCall(qsr_segment_lse_c128_bwd_cpu); });
  m.def("segment_lse_c64_fwd_cpu",
        []() { return EncapsulateFfiCall(qsr_segment_lse_c64_fwd_cpu); });
  m.def("segment_lse_c64_bwd_cpu",
        []() { return EncapsulateFfiCall(qsr_segment_lse_c64_bwd_cpu); });
}
