/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "shaders.hpp"

/* Dispatches may be two-dimensional when there are more workgroups than a
 * single dimension allows, hence the linear index over num_workgroups. */
#define BURST_WGSL_COMMON \
"struct Meta {\n" \
"	count: u32,\n" \
"	id_base: u32,\n" \
"	burst_lo: u32,\n" \
"	pad: u32,\n" \
"};\n" \
"\n" \
"fn linear_index(gid: vec3<u32>, nwg: vec3<u32>) -> u32 {\n" \
"	return gid.x + gid.y * nwg.x * 256u;\n" \
"}\n" \
"\n"


namespace burst {
	namespace wgpu {


const char* PROPAGATE_SHADER =
BURST_WGSL_COMMON
"struct Synapse {\n"
"	dst: u32,\n"
"	packed: u32,\n"  // weight | psp << 8 | kind << 16
"};\n"
"\n"
"@group(0) @binding(0) var<uniform> params: Meta;\n"
"@group(0) @binding(1) var<storage, read> fired: array<u32>;\n"
"@group(0) @binding(2) var<storage, read> row_start: array<u32>;\n"
"@group(0) @binding(3) var<storage, read> synapses: array<Synapse>;\n"
"@group(0) @binding(4) var<storage, read_write> current: array<atomic<u32>>;\n"
"@group(0) @binding(5) var<storage, read_write> touched: array<u32>;\n"
"\n"
"fn contribution(packed: u32) -> i32 {\n"
"	let c = i32(packed & 0xffu) * i32((packed >> 8u) & 0xffu);\n"
"	let kind = (packed >> 16u) & 0xffu;\n"
"	if (kind == 1u) {\n"
"		return -c;\n"
"	}\n"
"	if (kind == 2u) {\n"
"		return 0;\n"
"	}\n"
"	return c;\n"
"}\n"
"\n"
// 64-bit two's complement add as a (lo, hi) pair of u32 atomics
"fn add_current(dst: u32, c: i32) {\n"
"	let lo = bitcast<u32>(c);\n"
"	let hi = select(0u, 0xffffffffu, c < 0);\n"
"	let old = atomicAdd(&current[2u * dst], lo);\n"
"	let carry = select(0u, 1u, old + lo < old);\n"
"	atomicAdd(&current[2u * dst + 1u], hi + carry);\n"
"}\n"
"\n"
"@compute @workgroup_size(256)\n"
"fn main(@builtin(global_invocation_id) gid: vec3<u32>,\n"
"		@builtin(num_workgroups) nwg: vec3<u32>) {\n"
"	let f = linear_index(gid, nwg);\n"
"	if (f >= params.count) {\n"
"		return;\n"
"	}\n"
"	let source = fired[f];\n"
"	let end = row_start[source + 1u];\n"
"	for (var s = row_start[source]; s < end; s = s + 1u) {\n"
"		let syn = synapses[s];\n"
"		add_current(syn.dst, contribution(syn.packed));\n"
"		touched[syn.dst] = 1u;\n"
"	}\n"
"}\n";



#define BURST_WGSL_IO \
"struct NeuronInput {\n" \
"	value: f32,\n" \
"	has: u32,\n" \
"};\n" \
"\n" \
"struct NeuronOutput {\n" \
"	fired: u32,\n" \
"	potential: f32,\n" \
"};\n" \
"\n"


const char* LIF_SHADER =
BURST_WGSL_COMMON
BURST_WGSL_IO
"struct LifParams {\n"
"	threshold: f32,\n"
"	threshold_limit: f32,\n"
"	leak: f32,\n"
"	rest: f32,\n"
"	excitability: f32,\n"
"	refractory: u32,\n"
"	snooze: u32,\n"
"	fire_limit: u32,\n"
"	flags: u32,\n"  // bit 0: charge accumulation, bit 1: valid
"};\n"
"\n"
"struct LifState {\n"
"	potential: f32,\n"
"	countdown: u32,\n"
"	fire_count: u32,\n"
"};\n"
"\n"
"@group(0) @binding(0) var<uniform> params: Meta;\n"
"@group(0) @binding(1) var<storage, read> lif: array<LifParams>;\n"
"@group(0) @binding(2) var<storage, read_write> state: array<LifState>;\n"
"@group(0) @binding(3) var<storage, read> inputs: array<NeuronInput>;\n"
"@group(0) @binding(4) var<storage, read_write> outputs: array<NeuronOutput>;\n"
"\n"
"fn pcg_hash(x: u32) -> u32 {\n"
"	let state = x * 747796405u + 2891336453u;\n"
"	let word = ((state >> ((state >> 28u) + 4u)) ^ state) * 277803737u;\n"
"	return (word >> 22u) ^ word;\n"
"}\n"
"\n"
"fn excitability_pass(excitability: f32, id: u32, burst_lo: u32) -> bool {\n"
"	if (excitability >= 0.999) {\n"
"		return true;\n"
"	}\n"
"	if (excitability <= 0.0) {\n"
"		return false;\n"
"	}\n"
"	let seed = id * 2654435761u + burst_lo * 1597334677u;\n"
"	return f32(pcg_hash(seed)) * (1.0 / 4294967296.0) < excitability;\n"
"}\n"
"\n"
"@compute @workgroup_size(256)\n"
"fn main(@builtin(global_invocation_id) gid: vec3<u32>,\n"
"		@builtin(num_workgroups) nwg: vec3<u32>) {\n"
"	let n = linear_index(gid, nwg);\n"
"	if (n >= params.count) {\n"
"		return;\n"
"	}\n"
"	outputs[n] = NeuronOutput(0u, 0.0);\n"
"	let p = lif[n];\n"
"	if ((p.flags & 2u) == 0u) {\n"
"		return;\n"
"	}\n"
"	let accumulate = (p.flags & 1u) != 0u;\n"
"	var s = state[n];\n"
"	let inp = inputs[n];\n"
"	if (inp.has == 0u && s.countdown == 0u && s.potential == p.rest) {\n"
"		return;\n"
"	}\n"
"	if (s.countdown > 0u) {\n"
"		s.countdown = s.countdown - 1u;\n"
"		if (!accumulate) {\n"
"			s.potential = p.rest;\n"
"		}\n"
"		state[n] = s;\n"
"		return;\n"
"	}\n"
"	var v = s.potential;\n"
"	if (!accumulate) {\n"
"		v = p.rest;\n"
"	}\n"
"	let v1 = v + inp.value;\n"
"	var fired = v1 >= p.threshold && (p.threshold_limit <= 0.0 || v1 <= p.threshold_limit);\n"
"	if (fired) {\n"
"		if (p.fire_limit > 0u && s.fire_count >= p.fire_limit) {\n"
"			s.fire_count = 0u;\n"
"			s.potential = v1;\n"
"			state[n] = s;\n"
"			return;\n"
"		}\n"
"		fired = excitability_pass(p.excitability, params.id_base + n, params.burst_lo);\n"
"	}\n"
"	if (fired) {\n"
"		outputs[n] = NeuronOutput(1u, v1);\n"
"		s.potential = p.rest;\n"
"		s.countdown = (p.refractory + p.snooze) & 0xffffu;\n"
"		if (s.fire_count < 0xffffu) {\n"
"			s.fire_count = s.fire_count + 1u;\n"
"		}\n"
"	} else {\n"
"		s.potential = v1 - p.leak * (v1 - p.rest);\n"
"		s.fire_count = 0u;\n"
"	}\n"
"	state[n] = s;\n"
"}\n";



const char* IZHIKEVICH_SHADER =
BURST_WGSL_COMMON
BURST_WGSL_IO
"struct IzhikevichParams {\n"
"	a: f32,\n"
"	b: f32,\n"
"	c: f32,\n"
"	d: f32,\n"
"	valid: u32,\n"
"};\n"
"\n"
"struct IzhikevichState {\n"
"	u: f32,\n"
"	v: f32,\n"
"};\n"
"\n"
"@group(0) @binding(0) var<uniform> params: Meta;\n"
"@group(0) @binding(1) var<storage, read> izhikevich: array<IzhikevichParams>;\n"
"@group(0) @binding(2) var<storage, read_write> state: array<IzhikevichState>;\n"
"@group(0) @binding(3) var<storage, read> inputs: array<NeuronInput>;\n"
"@group(0) @binding(4) var<storage, read_write> outputs: array<NeuronOutput>;\n"
"\n"
"@compute @workgroup_size(256)\n"
"fn main(@builtin(global_invocation_id) gid: vec3<u32>,\n"
"		@builtin(num_workgroups) nwg: vec3<u32>) {\n"
"	let n = linear_index(gid, nwg);\n"
"	if (n >= params.count) {\n"
"		return;\n"
"	}\n"
"	outputs[n] = NeuronOutput(0u, 0.0);\n"
"	let p = izhikevich[n];\n"
"	if (p.valid == 0u) {\n"
"		return;\n"
"	}\n"
"	let i_syn = inputs[n].value;\n"
"	var u = state[n].u;\n"
"	var v = state[n].v;\n"
"	var fired = false;\n"
"	for (var t = 0u; t < 4u; t = t + 1u) {\n"
"		if (!fired) {\n"
"			v = v + 0.25 * ((0.04 * v + 5.0) * v + 140.0 - u + i_syn);\n"
"			u = u + 0.25 * (p.a * (p.b * v - u));\n"
"			fired = v >= 30.0;\n"
"		}\n"
"	}\n"
"	if (fired) {\n"
"		outputs[n] = NeuronOutput(1u, v);\n"
"		v = p.c;\n"
"		u = u + p.d;\n"
"	}\n"
"	state[n] = IzhikevichState(u, v);\n"
"}\n";

}	}
