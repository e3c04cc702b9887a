#pragma once

/*
In a nutshell
 * The client (Correlator) appends a Call Entry to a replicated mailbox document
 * The document replicates to the server, where the Dispatcher sees the new call,
   validates the input through the Router, and runs the handler on the executor
 * The Dispatcher appends a Response Entry, which replicates back
 * The Correlator sees the response, and settles the future for that call id
 * `with_batch` makes several Call Entries visible as one change
 */

#include "rpc/status.hpp"
#include "rpc/entry-codec.hpp"
#include "rpc/schema.hpp"
#include "rpc/router.hpp"
#include "rpc/call-context.hpp"
#include "rpc/processing-cursor.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/transaction-grouper.hpp"
#include "rpc/correlator.hpp"
