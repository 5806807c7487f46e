#ifndef BURST_FIRE_QUEUE_HPP
#define BURST_FIRE_QUEUE_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <map>
#include <vector>

#include <burst/config.h>
#include "types.h"

namespace burst {

/*! A neuron which fired, with the potential that crossed threshold */
struct FiringNeuron
{
	FiringNeuron() : id(0), potential(0.0f), area(0), x(0), y(0), z(0) {}

	nidx_t id;
	float potential;
	area_t area;
	uint32_t x, y, z;
};



/*! \brief Neurons which fired in one burst, in ascending id order
 *
 * Produced once per burst by the dynamics phase. Read by the next burst's
 * propagation phase, by the fire ledger and by external encoders.
 */
class BURST_DLL_PUBLIC FireQueue
{
	public :

		FireQueue() : m_burst(0) {}

		/*! Empty the queue and label it with a new burst */
		void reset(burst_t burst);

		/*! Append a neuron. Ids must be pushed in ascending order. */
		void push(const FiringNeuron& neuron);

		burst_t burst() const { return m_burst; }

		std::size_t size() const { return m_neurons.size(); }
		bool empty() const { return m_neurons.empty(); }

		const std::vector<FiringNeuron>& neurons() const { return m_neurons; }

		/*! \return ids of the fired neurons */
		std::vector<nidx_t> ids() const;

		bool contains(nidx_t id) const;

		/*! Drop a neuron which no longer exists
		 *
		 * \return true if the neuron was in the queue */
		bool erase(nidx_t id);

		/*! \return fired ids grouped by cortical area */
		std::map<area_t, std::vector<nidx_t> > byArea() const;

	private :

		burst_t m_burst;
		std::vector<FiringNeuron> m_neurons;
};

} // end namespace burst

#endif
