#ifndef BURST_NEURONS_HPP
#define BURST_NEURONS_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <vector>

#include <burst/config.h>
#include "types.h"
#include "Neuron.hpp"
#include "kernel/lif.h"
#include "kernel/izhikevich.h"

namespace burst {

/*! Fields every model stores for each of its neurons */
struct CommonArrays
{
	std::vector<uint8_t> valid;
	std::vector<area_t> area;
	std::vector<uint32_t> x, y, z;

	size_t size() const { return valid.size(); }
	void resize(size_t n);
};



/*! \brief Structure-of-arrays store of LIF neurons, indexed by local index */
struct LifNeurons : public CommonArrays
{
	/* parameters */
	std::vector<float> threshold;
	std::vector<float> thresholdLimit;
	std::vector<float> leak;
	std::vector<float> rest;
	std::vector<float> excitability;
	std::vector<uint16_t> refractoryPeriod;
	std::vector<uint16_t> snoozePeriod;
	std::vector<uint16_t> consecutiveFireLimit;
	std::vector<uint8_t> chargeAccumulation;

	/* state */
	std::vector<float> potential;
	std::vector<uint16_t> refractoryCountdown;
	std::vector<uint16_t> consecutiveFireCount;

	/*! Write neuron at \a idx, appending if \a idx == size() */
	void set(lidx_t idx, const LifNeuron& neuron);

	void resize(size_t n);

	/*! Pointer views for the shared update function. Valid until the
	 * arrays are resized. */
	lif_params_t params() const;
	lif_state_t state();
};



/*! \brief Structure-of-arrays store of Izhikevich neurons */
struct IzhikevichNeurons : public CommonArrays
{
	std::vector<float> a, b, c, d;
	std::vector<float> u, v;

	void set(lidx_t idx, const IzhikevichNeuron& neuron);

	void resize(size_t n);

	izhikevich_params_t params() const;
	izhikevich_state_t state();
};



/*! \brief Per-model neuron storage
 *
 * One store per model, each with arrays exactly as long as the model's id
 * extent. Slots of deallocated ids stay in place with the valid flag
 * cleared until the id is reused.
 *
 * The revision counter changes whenever parameters or the set of valid
 * neurons change. Backends holding device copies compare it to decide
 * when to upload again. State written back after a burst does not change it.
 */
class BURST_DLL_PUBLIC NeuronStorage
{
	public :

		NeuronStorage() : m_revision(0) {}

		/*! Store neuron at \a idx of the LIF model */
		void set(lidx_t idx, const LifNeuron& neuron);

		/*! Store neuron at \a idx of the Izhikevich model */
		void set(lidx_t idx, const IzhikevichNeuron& neuron);

		void invalidate(model_t model, lidx_t idx);

		size_t size(model_t model) const;

		/*! \return total number of slots over all models */
		size_t size() const;

		bool valid(model_t model, lidx_t idx) const;

		area_t area(model_t model, lidx_t idx) const;

		/*! \return the voltage-like state variable of the neuron */
		float membranePotential(model_t model, lidx_t idx) const;

		LifNeurons& lif() { return m_lif; }
		const LifNeurons& lif() const { return m_lif; }

		IzhikevichNeurons& izhikevich() { return m_izhikevich; }
		const IzhikevichNeurons& izhikevich() const { return m_izhikevich; }

		const CommonArrays& common(model_t model) const;

		uint64_t revision() const { return m_revision; }

	private :

		LifNeurons m_lif;
		IzhikevichNeurons m_izhikevich;

		uint64_t m_revision;
};

} // end namespace burst

#endif
