#pragma once

/*
===============================================================================
protolink — Public API Entry Point
===============================================================================

Schema compiler:
  protolink::schema::Compiler      .proto sources -> versioned Schema
  protolink::schema::Options       compiler configuration (+ JSON loader)

Session protocol:
  protolink::protocol::Command     handshake negotiation, heartbeat echo and
                                   state-gated data dispatch
  protolink::protocol::Config      command layer configuration
===============================================================================
*/

#include <protolink/schema/compiler.hpp>
#include <protolink/schema/document.hpp>
#include <protolink/schema/options.hpp>
#include <protolink/protocol/command.hpp>
#include <protolink/protocol/config.hpp>
