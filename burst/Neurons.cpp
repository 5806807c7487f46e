/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Neurons.hpp"

#include <boost/format.hpp>

#include "exception.hpp"

namespace burst {


void
CommonArrays::resize(size_t n)
{
	valid.resize(n, 0);
	area.resize(n, 0);
	x.resize(n, 0);
	y.resize(n, 0);
	z.resize(n, 0);
}



/* Grow the store by one if idx is one past the end. Any other index must
 * already exist. */
template<class S>
void
prepareSlot(S& store, lidx_t idx)
{
	using boost::format;
	if(idx == store.size()) {
		store.resize(store.size() + 1);
	} else if(idx > store.size()) {
		throw burst::exception(BURST_LOGIC_ERROR,
				str(format("Neuron slot %u is beyond the end of storage (%u)")
					% idx % store.size()));
	}
}



void
LifNeurons::resize(size_t n)
{
	CommonArrays::resize(n);
	threshold.resize(n, 0.0f);
	thresholdLimit.resize(n, 0.0f);
	leak.resize(n, 0.0f);
	rest.resize(n, 0.0f);
	excitability.resize(n, 0.0f);
	refractoryPeriod.resize(n, 0);
	snoozePeriod.resize(n, 0);
	consecutiveFireLimit.resize(n, 0);
	chargeAccumulation.resize(n, 0);
	potential.resize(n, 0.0f);
	refractoryCountdown.resize(n, 0);
	consecutiveFireCount.resize(n, 0);
}



void
LifNeurons::set(lidx_t n, const LifNeuron& neuron)
{
	prepareSlot(*this, n);
	threshold[n] = neuron.threshold;
	thresholdLimit[n] = neuron.thresholdLimit;
	leak[n] = neuron.leak;
	rest[n] = neuron.restingPotential;
	excitability[n] = neuron.excitability;
	refractoryPeriod[n] = neuron.refractoryPeriod;
	snoozePeriod[n] = neuron.snoozePeriod;
	consecutiveFireLimit[n] = neuron.consecutiveFireLimit;
	chargeAccumulation[n] = neuron.chargeAccumulation ? 1 : 0;
	potential[n] = neuron.membranePotential;
	refractoryCountdown[n] = 0;
	consecutiveFireCount[n] = 0;
	valid[n] = 1;
	area[n] = neuron.area;
	x[n] = neuron.x;
	y[n] = neuron.y;
	z[n] = neuron.z;
}



lif_params_t
LifNeurons::params() const
{
	lif_params_t p;
	p.threshold = &threshold[0];
	p.thresholdLimit = &thresholdLimit[0];
	p.leak = &leak[0];
	p.rest = &rest[0];
	p.excitability = &excitability[0];
	p.refractoryPeriod = &refractoryPeriod[0];
	p.snoozePeriod = &snoozePeriod[0];
	p.consecutiveFireLimit = &consecutiveFireLimit[0];
	p.chargeAccumulation = &chargeAccumulation[0];
	p.valid = &valid[0];
	return p;
}



lif_state_t
LifNeurons::state()
{
	lif_state_t s;
	s.potential = &potential[0];
	s.refractoryCountdown = &refractoryCountdown[0];
	s.consecutiveFireCount = &consecutiveFireCount[0];
	return s;
}



void
IzhikevichNeurons::resize(size_t n)
{
	CommonArrays::resize(n);
	a.resize(n, 0.0f);
	b.resize(n, 0.0f);
	c.resize(n, 0.0f);
	d.resize(n, 0.0f);
	u.resize(n, 0.0f);
	v.resize(n, 0.0f);
}



void
IzhikevichNeurons::set(lidx_t n, const IzhikevichNeuron& neuron)
{
	prepareSlot(*this, n);
	a[n] = neuron.a;
	b[n] = neuron.b;
	c[n] = neuron.c;
	d[n] = neuron.d;
	u[n] = neuron.u;
	v[n] = neuron.v;
	valid[n] = 1;
	area[n] = neuron.area;
	x[n] = neuron.x;
	y[n] = neuron.y;
	z[n] = neuron.z;
}



izhikevich_params_t
IzhikevichNeurons::params() const
{
	izhikevich_params_t p;
	p.a = &a[0];
	p.b = &b[0];
	p.c = &c[0];
	p.d = &d[0];
	p.valid = &valid[0];
	return p;
}



izhikevich_state_t
IzhikevichNeurons::state()
{
	izhikevich_state_t s;
	s.u = &u[0];
	s.v = &v[0];
	return s;
}



void
NeuronStorage::set(lidx_t idx, const LifNeuron& neuron)
{
	m_lif.set(idx, neuron);
	m_revision += 1;
}



void
NeuronStorage::set(lidx_t idx, const IzhikevichNeuron& neuron)
{
	m_izhikevich.set(idx, neuron);
	m_revision += 1;
}



void
NeuronStorage::invalidate(model_t model, lidx_t idx)
{
	switch(model) {
		case BURST_MODEL_LIF :
			m_lif.valid.at(idx) = 0;
			m_lif.potential[idx] = m_lif.rest[idx];
			m_lif.refractoryCountdown[idx] = 0;
			m_lif.consecutiveFireCount[idx] = 0;
			break;
		case BURST_MODEL_IZHIKEVICH :
			m_izhikevich.valid.at(idx) = 0;
			break;
		default :
			throw burst::exception(BURST_LOGIC_ERROR, "unknown neuron model");
	}
	m_revision += 1;
}



const CommonArrays&
NeuronStorage::common(model_t model) const
{
	switch(model) {
		case BURST_MODEL_LIF : return m_lif;
		case BURST_MODEL_IZHIKEVICH : return m_izhikevich;
		default :
			throw burst::exception(BURST_LOGIC_ERROR, "unknown neuron model");
	}
}



size_t
NeuronStorage::size(model_t model) const
{
	return common(model).size();
}



size_t
NeuronStorage::size() const
{
	return m_lif.size() + m_izhikevich.size();
}



bool
NeuronStorage::valid(model_t model, lidx_t idx) const
{
	const CommonArrays& c = common(model);
	return idx < c.size() && c.valid[idx];
}



area_t
NeuronStorage::area(model_t model, lidx_t idx) const
{
	return common(model).area.at(idx);
}



float
NeuronStorage::membranePotential(model_t model, lidx_t idx) const
{
	switch(model) {
		case BURST_MODEL_LIF : return m_lif.potential.at(idx);
		case BURST_MODEL_IZHIKEVICH : return m_izhikevich.v.at(idx);
		default :
			throw burst::exception(BURST_LOGIC_ERROR, "unknown neuron model");
	}
}

} // end namespace burst
