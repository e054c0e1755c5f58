#pragma once

#include "Trace.h"

#ifndef PT_DIAG_ENABLE
#define PT_DIAG_ENABLE 1
#endif

#define PT_DIAG_CONCAT_INNER(a, b) a##b
#define PT_DIAG_CONCAT(a, b) PT_DIAG_CONCAT_INNER(a, b)

#if PT_DIAG_ENABLE
#define ZONE_CPU(name) ::diag::ScopedCpuZone PT_DIAG_CONCAT(_diag_cpu_zone_, __LINE__){name}
#define MARK(name) ::diag::Mark(name)
#else
#define ZONE_CPU(name) (void)0
#define MARK(name) (void)0
#endif
