// ==============================================================================
// Midichain FX Lint Stub - compile every public header in one translation unit
// ==============================================================================
// Gives clang-tidy (and the compiler) a .cpp that includes every public
// header on its own, so a header that forgets one of its includes fails
// here first. Built as the OBJECT library target midichain_fx_lint_stub.
// ==============================================================================

// Layer 0: Core
#include <midichain/fx/core/clock.h>
#include <midichain/fx/core/events.h>
#include <midichain/fx/core/log.h>
#include <midichain/fx/core/midi_codec.h>
#include <midichain/fx/core/midi_utils.h>
#include <midichain/fx/core/random.h>
#include <midichain/fx/core/status.h>

// Layer 1: Primitives
#include <midichain/fx/primitives/controllable.h>
#include <midichain/fx/primitives/note_assembler.h>
#include <midichain/fx/primitives/release_buffer.h>

// Layer 2: Processors
#include <midichain/fx/processors/deferred_module.h>
#include <midichain/fx/processors/module.h>

// Layer 3: Systems
#include <midichain/fx/systems/chain.h>
#include <midichain/fx/systems/endpoints.h>

// Layer 4: Effects
#include <midichain/fx/effects/buffer_delay.h>
#include <midichain/fx/effects/delay.h>
