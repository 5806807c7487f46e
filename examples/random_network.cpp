/* Random network of LIF neurons driven by random stimulus. 80% of the
 * neurons are excitatory, the rest inhibitory. Each burst some neurons are
 * stimulated and the number of neurons which fired is printed.
 */

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/random.hpp>
#include <boost/scoped_ptr.hpp>
#include <burst.hpp>

typedef boost::mt19937 rng_t;
typedef boost::variate_generator<rng_t&, boost::uniform_real<double> > urng_t;
typedef boost::variate_generator<rng_t&, boost::uniform_int<> > uirng_t;

namespace burst {
	namespace random_network {

LifNeuron
excitatoryNeuron(urng_t& param)
{
	LifNeuron n;
	float r = float(param());
	n.threshold = 20000.0f + 10000.0f * r * r;
	n.leak = 0.1f;
	n.restingPotential = 0.0f;
	n.membranePotential = 0.0f;
	n.excitability = 0.9f;
	n.refractoryPeriod = 2;
	n.consecutiveFireLimit = 5;
	n.area = 1;
	return n;
}



LifNeuron
inhibitoryNeuron(urng_t& param)
{
	LifNeuron n = excitatoryNeuron(param);
	n.threshold = 15000.0f;
	n.refractoryPeriod = 1;
	n.area = 2;
	return n;
}



void
construct(Npu& npu, unsigned ncount, unsigned scount, rng_t& rng, std::vector<nidx_t>& ids)
{
	/* Neuron parameters and weights are partially randomised */
	urng_t randomParameter(rng, boost::uniform_real<double>(0, 1));
	uirng_t randomTarget(rng, boost::uniform_int<>(0, ncount-1));
	uirng_t randomWeight(rng, boost::uniform_int<>(1, 255));

	for(unsigned n = 0; n < ncount; ++n) {
		if(n < (ncount * 4) / 5) {
			ids.push_back(npu.addNeuron(excitatoryNeuron(randomParameter)));
		} else {
			ids.push_back(npu.addNeuron(inhibitoryNeuron(randomParameter)));
		}
	}

	for(unsigned n = 0; n < ncount; ++n) {
		bool excitatory = n < (ncount * 4) / 5;
		for(unsigned s = 0; s < scount; ++s) {
			uint8_t weight = uint8_t(randomWeight());
			npu.addSynapse(ids[n], ids[randomTarget()],
					weight, excitatory ? 64 : 128,
					excitatory ? BURST_SYNAPSE_EXCITATORY : BURST_SYNAPSE_INHIBITORY);
		}
	}
}

	} // namespace random_network
} // namespace burst



#define LOG(cond, ...) if(cond) fprintf(stdout, __VA_ARGS__)


int
main(int argc, char* argv[])
{
	namespace po = boost::program_options;

	po::options_description desc("Allowed options");
	desc.add_options()
		("help,h", "print this message")
		("neurons,n", po::value<unsigned>()->default_value(1000), "number of neurons")
		("synapses,m", po::value<unsigned>()->default_value(100), "number of synapses per neuron")
		("bursts,b", po::value<unsigned>()->default_value(100), "number of bursts to run")
		("stimulus,s", po::value<unsigned>()->default_value(50), "neurons stimulated per burst")
		("seed", po::value<unsigned>()->default_value(5489), "random seed")
		("config,c", po::value<std::string>(), "configuration file")
		("backend", po::value<std::string>(), "force backend: cpu, wgpu or cuda")
		("output-file,o", po::value<std::string>(), "write firing counts to this file")
		("verbose,v", po::value<unsigned>()->default_value(0), "verbosity level")
	;

	po::variables_map vm;
	try {
		po::store(po::parse_command_line(argc, argv, desc), vm);
		po::notify(vm);
	} catch(po::error& e) {
		std::cerr << e.what() << std::endl << desc << std::endl;
		return -1;
	}

	if(vm.count("help")) {
		std::cout << "Usage:\n\trandom_network [OPTIONS]\n\n" << desc << std::endl;
		return 0;
	}

	unsigned ncount = vm["neurons"].as<unsigned>();
	unsigned scount = vm["synapses"].as<unsigned>();
	unsigned bursts = vm["bursts"].as<unsigned>();
	unsigned stimulus = vm["stimulus"].as<unsigned>();
	unsigned verbose = vm["verbose"].as<unsigned>();

	std::ofstream file;
	std::string filename;

	if(vm.count("output-file")) {
		filename = vm["output-file"].as<std::string>();
		file.open(filename.c_str()); // closes on destructor
	}

	std::ostream& out = filename.empty() ? std::cout : file;

	try {
		LOG(verbose, "Creating configuration\n");
		boost::scoped_ptr<burst::Configuration> conf(vm.count("config")
				? new burst::Configuration(vm["config"].as<std::string>())
				: new burst::Configuration());
		if(vm.count("backend")) {
			std::string backend = vm["backend"].as<std::string>();
			if(backend == "cpu") {
				conf->forceCpuBackend();
			} else if(backend == "wgpu") {
				conf->forceWgpuBackend();
			} else if(backend == "cuda") {
				conf->forceCudaBackend();
			} else {
				std::cerr << "random_network: unknown backend " << backend << std::endl;
				return -1;
			}
		}
		if(verbose > 1) {
			conf->enableLogging();
		}

		LOG(verbose, "Constructing network\n");
		burst::Npu npu(ncount, ncount * scount, 64, *conf);
		rng_t rng(vm["seed"].as<unsigned>());
		std::vector<nidx_t> ids;
		burst::random_network::construct(npu, ncount, scount, rng, ids);

		uirng_t randomNeuron(rng, boost::uniform_int<>(0, ncount-1));

		LOG(verbose, "Running %u bursts\n", bursts);
		for(burst_t b = 1; b <= bursts; ++b) {
			for(unsigned s = 0; s < stimulus; ++s) {
				npu.injectStimulus(ids[randomNeuron()], 25000.0f);
			}
			const burst::FireQueue& fired = npu.processBurst(b);
			out << b << "\t" << fired.size() << "\n";
		}

		if(npu.backendDecision()) {
			LOG(verbose, "Backend: %s\n", npu.backendDecision()->reason.c_str());
		}
		LOG(verbose, "Simulation complete\n");
		return 0;
	} catch(std::runtime_error& e) {
		std::cerr << e.what() << std::endl;
		return -1;
	}
}
