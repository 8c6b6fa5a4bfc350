#ifndef OPENER_DEBOUNCERIF_HPP
#define OPENER_DEBOUNCERIF_HPP

#include<cstddef>

namespace Bitcoin { class TxId; }

namespace Opener {

/** class Opener::DebouncerIF
 *
 * @brief told how many channel completions will
 * ask to broadcast a transaction, so that it is
 * sent to the network only once.
 */
class DebouncerIF {
public:
	virtual ~DebouncerIF() { }

	virtual
	void set_debounce(Bitcoin::TxId const&, std::size_t count) =0;
};

}

#endif /* !defined(OPENER_DEBOUNCERIF_HPP) */
