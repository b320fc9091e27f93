#pragma once
#include <string>

struct Message {
    std::string id;             // unique id
    std::string queue;          // queue name (e.g., "landscape_analysis_treq")
    std::string body;           // raw JSON body as string
    std::string correlation_id;
    std::string reply_to;
    int delivery_count{0};
};

struct QueueDelivery {
    Message message;
    std::string delivery_tag; // "<id>.<delivery_count>"
    bool redelivered{false};
};
