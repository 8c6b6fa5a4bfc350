#ifndef OPENER_CHAINBROADCASTERIF_HPP
#define OPENER_CHAINBROADCASTERIF_HPP

namespace Bitcoin { struct Tx; }
namespace Ev { template<typename a> class Io; }

namespace Opener {

/** class Opener::ChainBroadcasterIF
 *
 * @brief submits transactions to the network.
 */
class ChainBroadcasterIF {
public:
	virtual ~ChainBroadcasterIF() { }

	virtual
	Ev::Io<void> broadcast_transaction(Bitcoin::Tx const&) =0;
};

}

#endif /* !defined(OPENER_CHAINBROADCASTERIF_HPP) */
