/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Configuration.hpp"
#include "ConfigurationImpl.hpp"

namespace burst {

Configuration::Configuration() :
	m_impl(new ConfigurationImpl())
{
	;
}



Configuration::Configuration(const Configuration& other) :
	m_impl(new ConfigurationImpl(*other.m_impl))
{
	;
}



Configuration::Configuration(const std::string& filename) :
	m_impl(new ConfigurationImpl())
{
	try {
		m_impl->loadFile(filename);
	} catch(...) {
		delete m_impl;
		throw;
	}
}



Configuration&
Configuration::operator=(const Configuration& rhs)
{
	if(this != &rhs) {
		*m_impl = *rhs.m_impl;
	}
	return *this;
}



Configuration::~Configuration()
{
	delete m_impl;
}


void
Configuration::enableLogging()
{
	m_impl->enableLogging();
}


void
Configuration::disableLogging()
{
	m_impl->disableLogging();
}


bool
Configuration::loggingEnabled() const
{
	return m_impl->loggingEnabled();
}



void
Configuration::forceCpuBackend()
{
	setAutomaticBackend();
	m_impl->setForceCpu(true);
}



void
Configuration::forceWgpuBackend()
{
	setAutomaticBackend();
	m_impl->setForceWgpu(true);
}



void
Configuration::forceCudaBackend(int device)
{
	setAutomaticBackend();
	m_impl->setForceCuda(true);
	m_impl->setCudaDevice(device);
}



void
Configuration::setAutomaticBackend()
{
	m_impl->setForceCpu(false);
	m_impl->setForceWgpu(false);
	m_impl->setForceCuda(false);
}



void
Configuration::setCudaDevice(int device)
{
	m_impl->setCudaDevice(device);
}



void
Configuration::setGpuThresholds(uint64_t neurons, uint64_t synapses)
{
	m_impl->setGpuThresholds(neurons, synapses);
}



void
Configuration::setCudaThresholds(uint64_t neurons, uint64_t synapses)
{
	m_impl->setCudaThresholds(neurons, synapses);
}



void
Configuration::setGpuMinFiringRate(double rate)
{
	m_impl->setGpuMinFiringRate(rate);
}



void
Configuration::setSpeedupModel(const SpeedupModel& model)
{
	m_impl->setSpeedupModel(model);
}



void
Configuration::setIdLookup(id_lookup_t mode)
{
	m_impl->setIdLookup(mode);
}



void
Configuration::setModelCeiling(model_t model, uint32_t ceiling)
{
	m_impl->setModelCeiling(model, ceiling);
}



void
Configuration::setCpuThreadCount(unsigned threads)
{
	m_impl->setCpuThreadCount(threads);
}



unsigned
Configuration::cpuThreadCount() const
{
	return m_impl->cpuThreadCount();
}

} // end namespace burst



std::ostream& operator<<(std::ostream& o, burst::Configuration const& conf)
{
	return o << *conf.m_impl;
}
