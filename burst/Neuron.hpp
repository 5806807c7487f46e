#ifndef BURST_NEURON_HPP
#define BURST_NEURON_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <burst/types.h>

namespace burst {

/*! \brief Parameters and initial state of a leaky integrate-and-fire neuron */
struct LifNeuron
{
	LifNeuron() :
		threshold(1.0f),
		thresholdLimit(0.0f),
		leak(0.0f),
		restingPotential(0.0f),
		membranePotential(0.0f),
		excitability(1.0f),
		refractoryPeriod(0),
		snoozePeriod(0),
		consecutiveFireLimit(0),
		chargeAccumulation(true),
		area(0), x(0), y(0), z(0) {}

	float threshold;
	float thresholdLimit;        // upper bound of the firing window, 0 = none
	float leak;                  // fraction of (V - V_rest) lost per burst, in [0,1]
	float restingPotential;
	float membranePotential;     // initial value
	float excitability;          // firing probability once above threshold, in [0,1]
	uint16_t refractoryPeriod;   // bursts skipped after firing
	uint16_t snoozePeriod;       // extra bursts skipped after firing
	uint16_t consecutiveFireLimit; // 0 = unlimited
	bool chargeAccumulation;     // carry potential across bursts

	area_t area;
	uint32_t x, y, z;
};



/*! \brief Parameters and initial state of an Izhikevich neuron */
struct IzhikevichNeuron
{
	IzhikevichNeuron() :
		a(0.02f), b(0.2f), c(-65.0f), d(8.0f),
		u(-13.0f), v(-65.0f),
		area(0), x(0), y(0), z(0) {}

	float a, b, c, d;
	float u, v;

	area_t area;
	uint32_t x, y, z;
};

}

#endif
