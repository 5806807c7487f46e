#ifndef BURST_WGPU_CONTEXT_HPP
#define BURST_WGPU_CONTEXT_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <string>
#include <vector>
#include <boost/shared_ptr.hpp>
#include <boost/utility.hpp>

#include <webgpu/webgpu.h>

namespace burst {
	namespace wgpu {


/*! \brief Adapter, device and queue of one wgpu-native instance
 *
 * All calls block until the device has finished. Validation and device
 * errors reported through the uncaptured-error callback are turned into
 * burst::ComputationError at the next \a check.
 */
class Context : private boost::noncopyable
{
	public :

		/*! \throws burst::BackendUnavailable if no adapter or device can be had */
		Context();

		~Context();

		WGPUDevice device() const { return m_device; }
		WGPUQueue queue() const { return m_queue; }

		const std::string& adapterName() const { return m_adapterName; }

		/*! \return largest size in bytes of a single storage binding */
		uint64_t maxStorageBinding() const { return m_maxStorageBinding; }

		/*! \return largest workgroup count in one dispatch dimension */
		uint32_t maxWorkgroupsPerDimension() const { return m_maxWorkgroups; }

		/*! Throw burst::ComputationError if the device reported an error */
		void check(const char* operation);

		/*! Block until all submitted work is done */
		void wait();

	private :

		WGPUInstance m_instance;
		WGPUAdapter m_adapter;
		WGPUDevice m_device;
		WGPUQueue m_queue;

		std::string m_adapterName;
		uint64_t m_maxStorageBinding;
		uint32_t m_maxWorkgroups;

		/* Set by the uncaptured-error callback */
		std::string m_error;

		static void onError(WGPUErrorType type, const char* message, void* userdata);

		void release();
};



/*! Device buffer with host transfer helpers */
class Buffer : private boost::noncopyable
{
	public :

		/*! Storage buffer of at least \a bytes (rounded up to a word) */
		Buffer(Context& ctx, size_t bytes, const char* label, bool uniform = false);

		~Buffer();

		WGPUBuffer handle() const { return m_buffer; }
		size_t bytes() const { return m_bytes; }

		void write(const void* data, size_t bytes);

		template<typename T>
		void write(const std::vector<T>& vec) {
			if(!vec.empty()) {
				write(&vec[0], vec.size() * sizeof(T));
			}
		}

		/*! Copy \a bytes from the start of the buffer to host memory */
		void read(void* data, size_t bytes);

		template<typename T>
		void read(std::vector<T>& vec, size_t count) {
			if(count > 0) {
				read(&vec[0], count * sizeof(T));
			}
		}

		/*! Fill with zero bytes */
		void clear();

	private :

		Context& m_ctx;
		WGPUBuffer m_buffer;
		size_t m_bytes;
		std::string m_label;
};



/*! Compute pipeline for one WGSL entry point 'main' and its bind group layout */
class Pipeline : private boost::noncopyable
{
	public :

		Pipeline(Context& ctx, const char* wgsl, const char* label);

		~Pipeline();

		/*! Run the shader over \a threads invocations with the buffers bound
		 * at bindings 0, 1, ... in order */
		void dispatch(unsigned threads, const std::vector<Buffer*>& bindings);

	private :

		Context& m_ctx;
		WGPUShaderModule m_module;
		WGPUComputePipeline m_pipeline;
		WGPUBindGroupLayout m_layout;
		std::string m_label;
};

}	}

#endif
