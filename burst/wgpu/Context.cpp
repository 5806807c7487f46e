/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Context.hpp"

#include <cstring>
#include <boost/format.hpp>
#include <webgpu/wgpu.h>

#include <burst/exception.hpp>
#include "shaders.hpp"

namespace burst {
	namespace wgpu {


namespace {

struct AdapterRequest
{
	AdapterRequest() : adapter(NULL), done(false) {}
	WGPUAdapter adapter;
	std::string message;
	bool done;
};


void
onAdapter(WGPURequestAdapterStatus status, WGPUAdapter adapter, const char* message, void* userdata)
{
	AdapterRequest* req = static_cast<AdapterRequest*>(userdata);
	if(status == WGPURequestAdapterStatus_Success) {
		req->adapter = adapter;
	} else if(message != NULL) {
		req->message = message;
	}
	req->done = true;
}


struct DeviceRequest
{
	DeviceRequest() : device(NULL), done(false) {}
	WGPUDevice device;
	std::string message;
	bool done;
};


void
onDevice(WGPURequestDeviceStatus status, WGPUDevice device, const char* message, void* userdata)
{
	DeviceRequest* req = static_cast<DeviceRequest*>(userdata);
	if(status == WGPURequestDeviceStatus_Success) {
		req->device = device;
	} else if(message != NULL) {
		req->message = message;
	}
	req->done = true;
}


struct MapRequest
{
	MapRequest() : status(WGPUBufferMapAsyncStatus_Unknown), done(false) {}
	WGPUBufferMapAsyncStatus status;
	bool done;
};


void
onMap(WGPUBufferMapAsyncStatus status, void* userdata)
{
	MapRequest* req = static_cast<MapRequest*>(userdata);
	req->status = status;
	req->done = true;
}


size_t
roundToWord(size_t bytes)
{
	return bytes == 0 ? 4 : (bytes + 3) & ~size_t(3);
}

}



Context::Context() :
	m_instance(NULL),
	m_adapter(NULL),
	m_device(NULL),
	m_queue(NULL),
	m_maxStorageBinding(0),
	m_maxWorkgroups(0)
{
	using boost::format;

	WGPUInstanceDescriptor instanceDesc;
	std::memset(&instanceDesc, 0, sizeof(instanceDesc));
	m_instance = wgpuCreateInstance(&instanceDesc);
	if(m_instance == NULL) {
		throw BackendUnavailable("Failed to create WebGPU instance");
	}

	/* wgpu-native completes requests before returning */
	WGPURequestAdapterOptions adapterOpts;
	std::memset(&adapterOpts, 0, sizeof(adapterOpts));
	adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;
	AdapterRequest areq;
	wgpuInstanceRequestAdapter(m_instance, &adapterOpts, onAdapter, &areq);
	if(!areq.done || areq.adapter == NULL) {
		release();
		throw BackendUnavailable(str(format("No WebGPU adapter: %s") % areq.message));
	}
	m_adapter = areq.adapter;

	WGPUAdapterProperties props;
	std::memset(&props, 0, sizeof(props));
	wgpuAdapterGetProperties(m_adapter, &props);
	m_adapterName = props.name == NULL ? "unknown adapter" : props.name;

	WGPUSupportedLimits supported;
	std::memset(&supported, 0, sizeof(supported));
	if(!wgpuAdapterGetLimits(m_adapter, &supported)) {
		release();
		throw BackendUnavailable("Failed to query WebGPU adapter limits");
	}

	/* Ask for the adapter's own limits rather than the WebGPU defaults, so
	 * large synapse arrays fit in one binding where the hardware allows */
	WGPURequiredLimits required;
	std::memset(&required, 0, sizeof(required));
	required.limits = supported.limits;

	WGPUDeviceDescriptor deviceDesc;
	std::memset(&deviceDesc, 0, sizeof(deviceDesc));
	deviceDesc.label = "burst";
	deviceDesc.requiredLimits = &required;
	DeviceRequest dreq;
	wgpuAdapterRequestDevice(m_adapter, &deviceDesc, onDevice, &dreq);
	if(!dreq.done || dreq.device == NULL) {
		release();
		throw BackendUnavailable(str(format("No WebGPU device on %s: %s")
					% m_adapterName % dreq.message));
	}
	m_device = dreq.device;
	m_queue = wgpuDeviceGetQueue(m_device);
	wgpuDeviceSetUncapturedErrorCallback(m_device, onError, this);

	m_maxStorageBinding = supported.limits.maxStorageBufferBindingSize;
	m_maxWorkgroups = supported.limits.maxComputeWorkgroupsPerDimension;
}



Context::~Context()
{
	release();
}



void
Context::release()
{
	if(m_queue != NULL) {
		wgpuQueueRelease(m_queue);
		m_queue = NULL;
	}
	if(m_device != NULL) {
		wgpuDeviceRelease(m_device);
		m_device = NULL;
	}
	if(m_adapter != NULL) {
		wgpuAdapterRelease(m_adapter);
		m_adapter = NULL;
	}
	if(m_instance != NULL) {
		wgpuInstanceRelease(m_instance);
		m_instance = NULL;
	}
}



void
Context::onError(WGPUErrorType type, const char* message, void* userdata)
{
	Context* ctx = static_cast<Context*>(userdata);
	if(ctx->m_error.empty()) {
		ctx->m_error = str(boost::format("error %d: %s")
				% int(type) % (message == NULL ? "(no message)" : message));
	}
}



void
Context::check(const char* operation)
{
	if(!m_error.empty()) {
		std::string msg = str(boost::format("WebGPU %s failed: %s") % operation % m_error);
		m_error.clear();
		throw ComputationError(msg);
	}
}



void
Context::wait()
{
	wgpuDevicePoll(m_device, true, NULL);
}



Buffer::Buffer(Context& ctx, size_t bytes, const char* label, bool uniform) :
	m_ctx(ctx),
	m_buffer(NULL),
	m_bytes(roundToWord(bytes)),
	m_label(label)
{
	using boost::format;

	if(!uniform && m_bytes > ctx.maxStorageBinding()) {
		throw ComputationError(str(format("%s (%uB) exceeds the device's storage binding limit (%uB)")
					% label % m_bytes % ctx.maxStorageBinding()));
	}

	WGPUBufferDescriptor desc;
	std::memset(&desc, 0, sizeof(desc));
	desc.label = m_label.c_str();
	desc.usage = (uniform ? WGPUBufferUsage_Uniform : WGPUBufferUsage_Storage)
		| WGPUBufferUsage_CopyDst | WGPUBufferUsage_CopySrc;
	desc.size = m_bytes;
	desc.mappedAtCreation = false;
	m_buffer = wgpuDeviceCreateBuffer(ctx.device(), &desc);
	if(m_buffer == NULL) {
		throw ComputationError(str(format("Failed to allocate %uB for %s") % m_bytes % label));
	}
	ctx.check("buffer allocation");
}



Buffer::~Buffer()
{
	wgpuBufferRelease(m_buffer);
}



void
Buffer::write(const void* data, size_t bytes)
{
	if(bytes > m_bytes || bytes % 4 != 0) {
		throw burst::exception(BURST_LOGIC_ERROR,
				str(boost::format("write of %uB into %s of %uB") % bytes % m_label % m_bytes));
	}
	wgpuQueueWriteBuffer(m_ctx.queue(), m_buffer, 0, data, bytes);
	m_ctx.check("buffer write");
}



void
Buffer::read(void* data, size_t bytes)
{
	using boost::format;

	if(bytes > m_bytes) {
		throw burst::exception(BURST_LOGIC_ERROR,
				str(format("read of %uB from %s of %uB") % bytes % m_label % m_bytes));
	}
	size_t padded = roundToWord(bytes);

	WGPUBufferDescriptor desc;
	std::memset(&desc, 0, sizeof(desc));
	desc.label = "readback";
	desc.usage = WGPUBufferUsage_MapRead | WGPUBufferUsage_CopyDst;
	desc.size = padded;
	WGPUBuffer staging = wgpuDeviceCreateBuffer(m_ctx.device(), &desc);
	if(staging == NULL) {
		throw ComputationError(str(format("Failed to allocate readback buffer for %s") % m_label));
	}

	WGPUCommandEncoderDescriptor encDesc;
	std::memset(&encDesc, 0, sizeof(encDesc));
	WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_ctx.device(), &encDesc);
	wgpuCommandEncoderCopyBufferToBuffer(encoder, m_buffer, 0, staging, 0, padded);
	WGPUCommandBufferDescriptor cmdDesc;
	std::memset(&cmdDesc, 0, sizeof(cmdDesc));
	WGPUCommandBuffer cmd = wgpuCommandEncoderFinish(encoder, &cmdDesc);
	wgpuQueueSubmit(m_ctx.queue(), 1, &cmd);
	wgpuCommandBufferRelease(cmd);
	wgpuCommandEncoderRelease(encoder);

	MapRequest req;
	wgpuBufferMapAsync(staging, WGPUMapMode_Read, 0, padded, onMap, &req);
	m_ctx.wait();

	if(!req.done || req.status != WGPUBufferMapAsyncStatus_Success) {
		wgpuBufferRelease(staging);
		m_ctx.check("buffer readback");
		throw ComputationError(str(format("Failed to map readback buffer for %s") % m_label));
	}

	const void* mapped = wgpuBufferGetConstMappedRange(staging, 0, padded);
	std::memcpy(data, mapped, bytes);
	wgpuBufferUnmap(staging);
	wgpuBufferRelease(staging);
	m_ctx.check("buffer readback");
}



void
Buffer::clear()
{
	WGPUCommandEncoderDescriptor encDesc;
	std::memset(&encDesc, 0, sizeof(encDesc));
	WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_ctx.device(), &encDesc);
	wgpuCommandEncoderClearBuffer(encoder, m_buffer, 0, m_bytes);
	WGPUCommandBufferDescriptor cmdDesc;
	std::memset(&cmdDesc, 0, sizeof(cmdDesc));
	WGPUCommandBuffer cmd = wgpuCommandEncoderFinish(encoder, &cmdDesc);
	wgpuQueueSubmit(m_ctx.queue(), 1, &cmd);
	wgpuCommandBufferRelease(cmd);
	wgpuCommandEncoderRelease(encoder);
	m_ctx.check("buffer clear");
}



Pipeline::Pipeline(Context& ctx, const char* wgsl, const char* label) :
	m_ctx(ctx),
	m_module(NULL),
	m_pipeline(NULL),
	m_layout(NULL),
	m_label(label)
{
	using boost::format;

	WGPUShaderModuleWGSLDescriptor wgslDesc;
	std::memset(&wgslDesc, 0, sizeof(wgslDesc));
	wgslDesc.chain.sType = WGPUSType_ShaderModuleWGSLDescriptor;
	wgslDesc.code = wgsl;

	WGPUShaderModuleDescriptor moduleDesc;
	std::memset(&moduleDesc, 0, sizeof(moduleDesc));
	moduleDesc.nextInChain = &wgslDesc.chain;
	moduleDesc.label = m_label.c_str();
	m_module = wgpuDeviceCreateShaderModule(ctx.device(), &moduleDesc);

	WGPUComputePipelineDescriptor pipelineDesc;
	std::memset(&pipelineDesc, 0, sizeof(pipelineDesc));
	pipelineDesc.label = m_label.c_str();
	pipelineDesc.compute.module = m_module;
	pipelineDesc.compute.entryPoint = "main";
	m_pipeline = wgpuDeviceCreateComputePipeline(ctx.device(), &pipelineDesc);
	if(m_module == NULL || m_pipeline == NULL) {
		if(m_module != NULL) {
			wgpuShaderModuleRelease(m_module);
		}
		ctx.check(label);
		throw BackendUnavailable(str(format("Failed to build %s shader") % label));
	}
	m_layout = wgpuComputePipelineGetBindGroupLayout(m_pipeline, 0);
	ctx.check(label);
}



Pipeline::~Pipeline()
{
	wgpuBindGroupLayoutRelease(m_layout);
	wgpuComputePipelineRelease(m_pipeline);
	wgpuShaderModuleRelease(m_module);
}



void
Pipeline::dispatch(unsigned threads, const std::vector<Buffer*>& bindings)
{
	std::vector<WGPUBindGroupEntry> entries(bindings.size());
	for(size_t i = 0; i < bindings.size(); ++i) {
		std::memset(&entries[i], 0, sizeof(WGPUBindGroupEntry));
		entries[i].binding = uint32_t(i);
		entries[i].buffer = bindings[i]->handle();
		entries[i].offset = 0;
		entries[i].size = bindings[i]->bytes();
	}

	WGPUBindGroupDescriptor groupDesc;
	std::memset(&groupDesc, 0, sizeof(groupDesc));
	groupDesc.label = m_label.c_str();
	groupDesc.layout = m_layout;
	groupDesc.entryCount = entries.size();
	groupDesc.entries = &entries[0];
	WGPUBindGroup group = wgpuDeviceCreateBindGroup(m_ctx.device(), &groupDesc);

	/* Workgroups beyond one dimension's limit spill into the second; the
	 * shaders linearise with the workgroup count in x. */
	uint32_t groups = (threads + WORKGROUP_SIZE - 1) / WORKGROUP_SIZE;
	uint32_t maxX = m_ctx.maxWorkgroupsPerDimension();
	uint32_t x = groups <= maxX ? groups : maxX;
	uint32_t y = (groups + x - 1) / x;

	WGPUCommandEncoderDescriptor encDesc;
	std::memset(&encDesc, 0, sizeof(encDesc));
	WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_ctx.device(), &encDesc);
	WGPUComputePassDescriptor passDesc;
	std::memset(&passDesc, 0, sizeof(passDesc));
	WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
	wgpuComputePassEncoderSetPipeline(pass, m_pipeline);
	wgpuComputePassEncoderSetBindGroup(pass, 0, group, 0, NULL);
	wgpuComputePassEncoderDispatchWorkgroups(pass, x, y, 1);
	wgpuComputePassEncoderEnd(pass);
	wgpuComputePassEncoderRelease(pass);

	WGPUCommandBufferDescriptor cmdDesc;
	std::memset(&cmdDesc, 0, sizeof(cmdDesc));
	WGPUCommandBuffer cmd = wgpuCommandEncoderFinish(encoder, &cmdDesc);
	wgpuQueueSubmit(m_ctx.queue(), 1, &cmd);
	wgpuCommandBufferRelease(cmd);
	wgpuCommandEncoderRelease(encoder);
	wgpuBindGroupRelease(group);

	m_ctx.wait();
	m_ctx.check(m_label.c_str());
}

}	}
