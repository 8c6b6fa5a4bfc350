#include"Secp256k1/Detail/context.hpp"
#include"Util/BacktraceException.hpp"
#include<secp256k1.h>
#include<stdexcept>
#include<string>

namespace {

/* libsecp256k1 reports API misuse here.  */
void illegal_callback(const char* msg, void*) {
	throw Util::BacktraceException<std::invalid_argument>(
		std::string("secp256k1: ") + msg
	);
}

std::shared_ptr<secp256k1_context_struct> make_context() {
	auto ctx = std::shared_ptr<secp256k1_context_struct>(
		secp256k1_context_create(SECP256K1_CONTEXT_VERIFY),
		&secp256k1_context_destroy
	);
	secp256k1_context_set_illegal_callback( ctx.get()
					      , &illegal_callback
					      , nullptr
					      );
	return ctx;
}

}

namespace Secp256k1 {
namespace Detail {

std::shared_ptr<secp256k1_context_struct> const context = make_context();

}
}
