#pragma once

#include "relaydeck/client/web_socket_client.hpp"
#include "relaydeck/client/websocketpp_client.hpp"
#include "relaydeck/codec/wire_codec.hpp"
#include "relaydeck/data/data.hpp"
#include "relaydeck/pool/config.hpp"
#include "relaydeck/pool/event_stream.hpp"
#include "relaydeck/pool/pool_types.hpp"
#include "relaydeck/pool/relay_pool.hpp"
#include "relaydeck/pool/subscription_router.hpp"
#include "relaydeck/signer/noscrypt_signer.hpp"
#include "relaydeck/signer/signer.hpp"
#include "relaydeck/store/event_store.hpp"
#include "relaydeck/store/memory_event_store.hpp"
#include "relaydeck/validation/event_validator.hpp"
