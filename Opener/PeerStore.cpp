#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Opener/PeerStore.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include"Sqlite3/Tx.hpp"

namespace {

std::int64_t now_seconds() {
	return std::int64_t(Ev::now());
}

std::string const columns = "id, created_at, updated_at, node_id, pubkey"
			    ", zero_conf, label"
			    ;

Opener::Peer read_peer(Sqlite3::Result const& r) {
	auto p = Opener::Peer();
	p.id = Uuid(r.column<std::string>(0));
	p.created_at = r.column<std::int64_t>(1);
	p.updated_at = r.column<std::int64_t>(2);
	p.node_id = r.column<std::string>(3);
	p.pubkey = r.column<std::string>(4);
	p.zero_conf = r.column<bool>(5);
	if (!r.column_is_null(6))
		p.label = r.column<std::string>(6);
	return p;
}

void bind_label(Sqlite3::Query& q, std::string const& label) {
	if (label.empty())
		q.bind_null(":label");
	else
		q.bind(":label", label);
}

std::string describe(std::string const& node_id, std::string const& pubkey) {
	return node_id + "/" + pubkey;
}

}

namespace Opener {

Ev::Io<void> PeerStore::init() {
	return db.transact().then([](Sqlite3::Tx tx) {
		tx.execute("\
		CREATE TABLE IF NOT EXISTS \"OpenerPeers\" \
		     ( id TEXT PRIMARY KEY \
		     , created_at INTEGER NOT NULL \
		     , updated_at INTEGER NOT NULL \
		     , node_id TEXT NOT NULL \
		     , pubkey TEXT NOT NULL \
		     , zero_conf INTEGER NOT NULL \
		     , label TEXT \
		     , UNIQUE (node_id, pubkey) \
		     );\
		");
		tx.commit();
		return Ev::lift();
	});
}

Ev::Io<Peer> PeerStore::create( std::string const& node_id
			      , std::string const& pubkey
			      , std::string const& label
			      , bool zero_conf
			      ) {
	return db.transact().then([ node_id, pubkey, label, zero_conf
				  ](Sqlite3::Tx tx) {
		auto exists = tx.query("\
		SELECT 1 FROM \"OpenerPeers\" \
		 WHERE node_id = :node_id AND pubkey = :pubkey;\
		")
			.bind(":node_id", node_id)
			.bind(":pubkey", pubkey)
			.execute();
		if (exists.next())
			throw PeerStoreError( "Peer already recorded: "
					    + describe(node_id, pubkey)
					    );

		auto p = Peer();
		p.id = Uuid::random();
		p.created_at = now_seconds();
		p.updated_at = p.created_at;
		p.node_id = node_id;
		p.pubkey = pubkey;
		p.zero_conf = zero_conf;
		p.label = label;

		auto q = tx.query("\
		INSERT INTO \"OpenerPeers\" \
		VALUES(:id, :created_at, :updated_at, :node_id, :pubkey \
		      , :zero_conf, :label);\
		");
		q.bind(":id", std::string(p.id))
		 .bind(":created_at", p.created_at)
		 .bind(":updated_at", p.updated_at)
		 .bind(":node_id", p.node_id)
		 .bind(":pubkey", p.pubkey)
		 .bind(":zero_conf", p.zero_conf)
		 ;
		bind_label(q, p.label);
		q.execute();

		tx.commit();
		return Ev::lift(std::move(p));
	});
}

Ev::Io<std::shared_ptr<Peer>>
PeerStore::find(std::string const& node_id, std::string const& pubkey) {
	return db.transact().then([node_id, pubkey](Sqlite3::Tx tx) {
		auto res = tx.query("SELECT " + columns + "\
		  FROM \"OpenerPeers\" \
		 WHERE node_id = :node_id AND pubkey = :pubkey;\
		")
			.bind(":node_id", node_id)
			.bind(":pubkey", pubkey)
			.execute();
		auto rv = std::shared_ptr<Peer>();
		if (res.next())
			rv = std::make_shared<Peer>(read_peer(res));
		tx.commit();
		return Ev::lift(std::move(rv));
	});
}

Ev::Io<std::vector<Peer>> PeerStore::list(std::string const& node_id) {
	return db.transact().then([node_id](Sqlite3::Tx tx) {
		auto res = tx.query("SELECT " + columns + "\
		  FROM \"OpenerPeers\" \
		 WHERE node_id = :node_id \
		 ORDER BY created_at, rowid;\
		")
			.bind(":node_id", node_id)
			.execute();
		auto rv = std::vector<Peer>();
		while (res.next())
			rv.push_back(read_peer(res));
		tx.commit();
		return Ev::lift(std::move(rv));
	});
}

Ev::Io<void> PeerStore::update_label( std::string const& node_id
				    , std::string const& pubkey
				    , std::string const& label
				    ) {
	return db.transact().then([node_id, pubkey, label](Sqlite3::Tx tx) {
		auto q = tx.query("\
		UPDATE \"OpenerPeers\" \
		   SET label = :label, updated_at = :updated_at \
		 WHERE node_id = :node_id AND pubkey = :pubkey;\
		");
		bind_label(q, label);
		q.bind(":updated_at", now_seconds())
		 .bind(":node_id", node_id)
		 .bind(":pubkey", pubkey)
		 ;
		auto res = q.execute();
		if (res.changes() == 0)
			throw PeerStoreError( "No such peer: "
					    + describe(node_id, pubkey)
					    );
		tx.commit();
		return Ev::lift();
	});
}

Ev::Io<void> PeerStore::set_zero_conf( std::string const& node_id
				     , std::string const& pubkey
				     , bool zero_conf
				     ) {
	return db.transact().then([node_id, pubkey, zero_conf](Sqlite3::Tx tx) {
		auto res = tx.query("\
		UPDATE \"OpenerPeers\" \
		   SET zero_conf = :zero_conf, updated_at = :updated_at \
		 WHERE node_id = :node_id AND pubkey = :pubkey;\
		")
			.bind(":zero_conf", zero_conf)
			.bind(":updated_at", now_seconds())
			.bind(":node_id", node_id)
			.bind(":pubkey", pubkey)
			.execute();
		if (res.changes() == 0)
			throw PeerStoreError( "No such peer: "
					    + describe(node_id, pubkey)
					    );
		tx.commit();
		return Ev::lift();
	});
}

Ev::Io<bool> PeerStore::remove( std::string const& node_id
			      , std::string const& pubkey
			      ) {
	return db.transact().then([node_id, pubkey](Sqlite3::Tx tx) {
		auto res = tx.query("\
		DELETE FROM \"OpenerPeers\" \
		 WHERE node_id = :node_id AND pubkey = :pubkey;\
		")
			.bind(":node_id", node_id)
			.bind(":pubkey", pubkey)
			.execute();
		auto removed = res.changes() > 0;
		tx.commit();
		return Ev::lift(removed);
	});
}

}
