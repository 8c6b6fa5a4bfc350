#ifndef OPENER_PEERSTORE_HPP
#define OPENER_PEERSTORE_HPP

#include"Sqlite3/Db.hpp"
#include"Util/BacktraceException.hpp"
#include"Uuid.hpp"
#include<cstdint>
#include<memory>
#include<stdexcept>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Opener {

/* Thrown on duplicate or missing peer records.  */
class PeerStoreError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	PeerStoreError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

/** struct Opener::Peer
 *
 * @brief what a local node remembers about one
 * counterparty.
 *
 * @desc Timestamps are seconds since the epoch.
 * An empty label means none.
 */
struct Peer {
	Uuid id;
	std::int64_t created_at;
	std::int64_t updated_at;
	std::string node_id;
	std::string pubkey;
	bool zero_conf;
	std::string label;

	Peer() : created_at(0), updated_at(0), zero_conf(false) { }
};

/** class Opener::PeerStore
 *
 * @brief peer records in an SQLITE3 database,
 * keyed by (local node id, counterparty pubkey).
 */
class PeerStore {
private:
	Sqlite3::Db db;

public:
	PeerStore() =delete;
	explicit
	PeerStore(Sqlite3::Db db_) : db(std::move(db_)) { }

	/* Creates the table if absent.  */
	Ev::Io<void> init();

	/* Throws PeerStoreError if the pair already
	 * has a record.  */
	Ev::Io<Peer> create( std::string const& node_id
			   , std::string const& pubkey
			   , std::string const& label
			   , bool zero_conf
			   );
	/* Null if there is no record.  */
	Ev::Io<std::shared_ptr<Peer>> find( std::string const& node_id
					  , std::string const& pubkey
					  );
	/* Oldest first.  */
	Ev::Io<std::vector<Peer>> list(std::string const& node_id);

	/* These throw PeerStoreError if there is no
	 * record.  */
	Ev::Io<void> update_label( std::string const& node_id
				 , std::string const& pubkey
				 , std::string const& label
				 );
	Ev::Io<void> set_zero_conf( std::string const& node_id
				  , std::string const& pubkey
				  , bool zero_conf
				  );

	/* Returns whether a record was removed.  */
	Ev::Io<bool> remove( std::string const& node_id
			   , std::string const& pubkey
			   );
};

}

#endif /* !defined(OPENER_PEERSTORE_HPP) */
