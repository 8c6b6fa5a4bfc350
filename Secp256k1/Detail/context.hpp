#ifndef SECP256K1_DETAIL_CONTEXT_HPP
#define SECP256K1_DETAIL_CONTEXT_HPP

#include<memory>

extern "C" {
struct secp256k1_context_struct;
}

namespace Secp256k1 {
namespace Detail {

/* Process-wide verification context.
 * The struct is opaque, so a shared_ptr carries
 * the destroy function without exposing it.  */
extern std::shared_ptr<secp256k1_context_struct> const context;

}
}

#endif /* !defined(SECP256K1_DETAIL_CONTEXT_HPP) */
