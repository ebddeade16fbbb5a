#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/provider/provider_client.hpp"
#include "internal/retrieval/retrieval_engine.hpp"

namespace ragturn::turn {

/*
  System prompt that confines the answer to the retrieved excerpts. Each
  excerpt is numbered from 1 so the model can cite it as [n].
*/
std::string BuildGroundingPrompt(const std::vector<retrieval::RetrievalResult>& results);

// The newest `max_messages` entries, order kept.
std::vector<provider::ChatMessage> TrimConversation(std::vector<provider::ChatMessage> messages, std::size_t max_messages);

} // namespace ragturn::turn
