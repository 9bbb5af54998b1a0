// SPDX-License-Identifier: Apache-2.0
#include "TransportSession.hpp"

#include <supervisor/EventStreamSession.hpp>
#include <supervisor/LocalPortSession.hpp>
#include <supervisor/PipeSession.hpp>

namespace mcpbridge
{

auto makeSessionFactory(SessionOptions options, sse::EventStreamFactory streamFactory) -> SessionFactory
{
    return [options, streamFactory = std::move(streamFactory)](
               const ServerDescriptor& descriptor) -> std::unique_ptr<TransportSession> {
        switch (descriptor.mode)
        {
            case TransportMode::Pipe: return std::make_unique<PipeSession>(descriptor, options);
            case TransportMode::LocalPort: return std::make_unique<LocalPortSession>(descriptor, options);
            case TransportMode::EventStream:
                return std::make_unique<EventStreamSession>(descriptor, options, streamFactory);
        }
        return std::make_unique<PipeSession>(descriptor, options);
    };
}

} // namespace mcpbridge
