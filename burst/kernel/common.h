#ifndef BURST_KERNEL_COMMON_H
#define BURST_KERNEL_COMMON_H

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

/* Definitions shared between host code and CUDA device code. Everything
 * included from kernel/ must compile both as C++ and under nvcc. */

#include <stdint.h>

#ifdef __CUDACC__
#	define BURST_HOST_DEVICE __host__ __device__
#else
#	define BURST_HOST_DEVICE
#endif

#endif
