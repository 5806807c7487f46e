#include <sstream>
#include <string>
#include <boost/test/unit_test.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <burst/BackendSelector.hpp>
#include <burst/Configuration.hpp>
#include <burst/ConfigurationImpl.hpp>
#include <burst/exception.hpp>


BOOST_AUTO_TEST_SUITE(backend_selection)


BOOST_AUTO_TEST_CASE(small_network_on_cpu)
{
	burst::ConfigurationImpl conf;
	burst::BackendDecision d =
		burst::selectBackend(1000, 100000, 0.01, burst::HardwareAvailability(true, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_CPU);
	BOOST_REQUIRE(!d.forced);
	BOOST_REQUIRE_EQUAL(d.estimatedSpeedup, 1.0);
	BOOST_REQUIRE(!d.reason.empty());
}



BOOST_AUTO_TEST_CASE(threshold_order)
{
	burst::ConfigurationImpl conf;
	conf.setCudaThresholds(1000, 1000000);
	conf.setGpuThresholds(5000, 5000000);

	/* thresholds alone decide */
	burst::SpeedupModel model;
	model.requiredSpeedup = 0.0;
	conf.setSpeedupModel(model);

	/* CUDA wins when both are present and its threshold is reached */
	burst::BackendDecision d =
		burst::selectBackend(2000, 10, 0.01, burst::HardwareAvailability(true, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_CUDA);

	/* synapse count alone is enough */
	d = burst::selectBackend(10, 2000000, 0.01, burst::HardwareAvailability(true, false), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_CUDA);

	d = burst::selectBackend(2000, 10, 0.01, burst::HardwareAvailability(false, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_CPU);

	d = burst::selectBackend(6000, 10, 0.01, burst::HardwareAvailability(false, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_WGPU);
	BOOST_REQUIRE(!d.forced);

	d = burst::selectBackend(6000, 10, 0.01, burst::HardwareAvailability(false, false), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_CPU);
}



BOOST_AUTO_TEST_CASE(forced)
{
	burst::ConfigurationImpl conf;
	conf.setForceWgpu(true);

	burst::BackendDecision d =
		burst::selectBackend(1, 0, 0.0, burst::HardwareAvailability(true, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_WGPU);
	BOOST_REQUIRE(d.forced);

	BOOST_REQUIRE_THROW(
			burst::selectBackend(1, 0, 0.0, burst::HardwareAvailability(true, false), conf),
			burst::BackendUnavailable);

	conf.setForceWgpu(false);
	conf.setForceCpu(true);
	d = burst::selectBackend(10000000, 0, 0.0, burst::HardwareAvailability(true, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_CPU);
	BOOST_REQUIRE(d.forced);
}



BOOST_AUTO_TEST_CASE(speedup_estimate)
{
	burst::SpeedupModel model;

	BOOST_REQUIRE_EQUAL(burst::estimateSpeedup(BURST_BACKEND_CPU, 1000000, 100000000, 0.05, model), 1.0);

	/* Tiny networks are dominated by dispatch overhead */
	double tiny = burst::estimateSpeedup(BURST_BACKEND_CUDA, 10, 10, 0.05, model);
	BOOST_REQUIRE_EQUAL(tiny, model.minSpeedup);

	double small = burst::estimateSpeedup(BURST_BACKEND_CUDA, 10000, 1000000, 0.05, model);
	double large = burst::estimateSpeedup(BURST_BACKEND_CUDA, 1000000, 100000000, 0.05, model);
	BOOST_REQUIRE(large > small);
	BOOST_REQUIRE(large <= model.maxSpeedup);

	/* the slower device gives a lower estimate for the same load */
	double wgpu = burst::estimateSpeedup(BURST_BACKEND_WGPU, 1000000, 100000000, 0.05, model);
	BOOST_REQUIRE(wgpu <= large);
}



/* A GPU at its size threshold is skipped when the estimate is too low */
BOOST_AUTO_TEST_CASE(speedup_gate)
{
	burst::ConfigurationImpl conf;
	const burst::SpeedupModel& model = conf.speedupModel();
	BOOST_REQUIRE_EQUAL(model.requiredSpeedup, 1.5);

	/* at the CUDA neuron threshold but without synapses the estimate is small */
	BOOST_REQUIRE(burst::estimateSpeedup(BURST_BACKEND_CUDA, 100000, 0, 0.05, model) <= 1.5);
	burst::BackendDecision d =
		burst::selectBackend(100000, 0, 0.05, burst::HardwareAvailability(true, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_CPU);
	BOOST_REQUIRE_EQUAL(d.estimatedSpeedup, 1.0);
	BOOST_REQUIRE(d.reason.find("CUDA estimated speedup") != std::string::npos);

	/* CUDA pays off for this load, WGPU does not */
	BOOST_REQUIRE(burst::estimateSpeedup(BURST_BACKEND_CUDA, 1000000, 100000000, 0.05, model) > 1.5);
	BOOST_REQUIRE(burst::estimateSpeedup(BURST_BACKEND_WGPU, 1000000, 100000000, 0.05, model) <= 1.5);

	d = burst::selectBackend(1000000, 100000000, 0.05, burst::HardwareAvailability(true, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_CUDA);
	BOOST_REQUIRE(d.estimatedSpeedup > 1.5);

	d = burst::selectBackend(1000000, 100000000, 0.05, burst::HardwareAvailability(false, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_CPU);
	BOOST_REQUIRE(d.reason.find("WGPU estimated speedup") != std::string::npos);

	/* a heavier load makes WGPU worthwhile too */
	d = burst::selectBackend(1000000, 1000000000, 0.05, burst::HardwareAvailability(false, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_WGPU);
	BOOST_REQUIRE(d.estimatedSpeedup > 1.5);

	/* forcing bypasses the gate */
	conf.setForceWgpu(true);
	d = burst::selectBackend(10, 0, 0.05, burst::HardwareAvailability(false, true), conf);
	BOOST_REQUIRE_EQUAL(d.backend, BURST_BACKEND_WGPU);
	BOOST_REQUIRE(d.estimatedSpeedup < 1.5);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(configuration_options)


BOOST_AUTO_TEST_CASE(defaults)
{
	burst::ConfigurationImpl conf;
	conf.verify();
	BOOST_REQUIRE(!conf.forcedBackend());
	BOOST_REQUIRE(!conf.loggingEnabled());
	BOOST_REQUIRE_EQUAL(conf.cpuThreadCount(), 1U);
	BOOST_REQUIRE(conf.cudaNeuronThreshold() <= conf.gpuNeuronThreshold());
}



BOOST_AUTO_TEST_CASE(validation)
{
	{
		burst::ConfigurationImpl conf;
		conf.setForceCpu(true);
		conf.setForceCuda(true);
		BOOST_REQUIRE_THROW(conf.verify(), burst::ConfigurationError);
	}
	{
		burst::ConfigurationImpl conf;
		conf.setCudaThresholds(1000, 10);
		conf.setGpuThresholds(10, 10);
		BOOST_REQUIRE_THROW(conf.verify(), burst::ConfigurationError);
	}
	{
		burst::ConfigurationImpl conf;
		conf.setGpuMinFiringRate(-0.1);
		BOOST_REQUIRE_THROW(conf.verify(), burst::ConfigurationError);
	}
	{
		burst::ConfigurationImpl conf;
		burst::SpeedupModel model;
		model.cpuGflops = 0.0;
		conf.setSpeedupModel(model);
		BOOST_REQUIRE_THROW(conf.verify(), burst::ConfigurationError);
	}
	{
		burst::ConfigurationImpl conf;
		burst::SpeedupModel model;
		model.requiredSpeedup = -1.0;
		conf.setSpeedupModel(model);
		BOOST_REQUIRE_THROW(conf.verify(), burst::ConfigurationError);
	}
	{
		burst::ConfigurationImpl conf;
		conf.setCpuThreadCount(0);
		BOOST_REQUIRE_THROW(conf.verify(), burst::ConfigurationError);
	}
	{
		burst::ConfigurationImpl conf;
		BOOST_REQUIRE_THROW(conf.setModelCeiling(BURST_MODEL_COUNT, 10), burst::ConfigurationError);
	}
}



BOOST_AUTO_TEST_CASE(backend_switches)
{
	burst::Configuration conf;
	conf.forceCudaBackend(1);
	conf.forceCpuBackend();
	conf.setAutomaticBackend();
	conf.forceWgpuBackend();
	std::ostringstream out;
	out << conf;
	BOOST_REQUIRE(out.str().find("WGPU") != std::string::npos);
}



namespace {

/* Scratch file removed when the test finishes */
class TempFile
{
	public :

		explicit TempFile(const std::string& contents) :
			m_path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("burst-%%%%-%%%%.ini"))
		{
			boost::filesystem::ofstream file(m_path);
			file << contents;
		}

		~TempFile() {
			boost::system::error_code ec;
			boost::filesystem::remove(m_path, ec);
		}

		std::string name() const { return m_path.string(); }

	private :

		boost::filesystem::path m_path;
};

}



BOOST_AUTO_TEST_CASE(load_file)
{
	TempFile file(
			"[logging]\n"
			"enabled = true\n"
			"[backend]\n"
			"force = wgpu\n"
			"gpu_neuron_threshold = 2000\n"
			"cuda_neuron_threshold = 1000\n"
			"gpu_min_firing_rate = 0.1\n"
			"[speedup]\n"
			"cpu_gflops = 50\n"
			"required = 2.5\n"
			"[ids]\n"
			"lookup = table\n"
			"lif_ceiling = 300\n"
			"[cpu]\n"
			"threads = 2\n");

	burst::ConfigurationImpl conf;
	conf.loadFile(file.name());

	BOOST_REQUIRE(conf.loggingEnabled());
	BOOST_REQUIRE_EQUAL(conf.forcedBackend().get(), BURST_BACKEND_WGPU);
	BOOST_REQUIRE_EQUAL(conf.gpuNeuronThreshold(), 2000U);
	BOOST_REQUIRE_EQUAL(conf.cudaNeuronThreshold(), 1000U);
	BOOST_REQUIRE_EQUAL(conf.gpuMinFiringRate(), 0.1);
	BOOST_REQUIRE_EQUAL(conf.speedupModel().cpuGflops, 50.0);
	BOOST_REQUIRE_EQUAL(conf.speedupModel().requiredSpeedup, 2.5);
	BOOST_REQUIRE_EQUAL(conf.idLookup(), BURST_ID_LOOKUP_TABLE);
	BOOST_REQUIRE_EQUAL(conf.modelCeiling(BURST_MODEL_LIF), 300U);
	BOOST_REQUIRE_EQUAL(conf.cpuThreadCount(), 2U);
	conf.verify();

	/* the public wrapper reads the same file */
	burst::Configuration pub(file.name());
	BOOST_REQUIRE(pub.loggingEnabled());
	BOOST_REQUIRE_EQUAL(pub.cpuThreadCount(), 2U);
}



BOOST_AUTO_TEST_CASE(load_errors)
{
	burst::ConfigurationImpl conf;
	BOOST_REQUIRE_THROW(conf.loadFile("/nonexistent/burst.ini"), burst::ConfigurationError);

	TempFile badBackend("[backend]\nforce = opencl\n");
	BOOST_REQUIRE_THROW(conf.loadFile(badBackend.name()), burst::ConfigurationError);

	TempFile badKey("[backend]\nbogus = 1\n");
	BOOST_REQUIRE_THROW(conf.loadFile(badKey.name()), burst::ConfigurationError);

	TempFile badValue("[cpu]\nthreads = many\n");
	BOOST_REQUIRE_THROW(conf.loadFile(badValue.name()), burst::ConfigurationError);

	TempFile badLookup("[ids]\nlookup = hash\n");
	BOOST_REQUIRE_THROW(conf.loadFile(badLookup.name()), burst::ConfigurationError);

	BOOST_REQUIRE_THROW(burst::Configuration(badKey.name()), burst::ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()
