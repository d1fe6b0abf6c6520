#include "behavior/registry.hpp"

namespace behavior {
namespace {

// data-management

constexpr std::string_view k_pagination = R"json({
  "name": "std/Pagination",
  "category": "data-management",
  "description": "Page-based navigation for large data sets",
  "suggestedFor": ["Large lists", "Table pagination", "Infinite scroll alternative", "Data-heavy views"],
  "dataEntities": [
    {"name": "PaginationState", "runtime": true, "singleton": true, "fields": [
      {"name": "page", "type": "number", "default": 1},
      {"name": "pageSize", "type": "number", "default": 20},
      {"name": "totalItems", "type": "number", "default": 0}
    ]}
  ],
  "stateMachine": {
    "initial": "Active",
    "states": [{"name": "Active", "isInitial": true}],
    "events": [{"key": "INIT"}, {"key": "NEXT_PAGE"}, {"key": "PREV_PAGE"}, {"key": "GO_TO_PAGE"},
               {"key": "SET_PAGE_SIZE"}, {"key": "SET_TOTAL"}],
    "transitions": [
      {"from": "*", "event": "INIT", "effects": [
        ["set", "@entity.page", 1],
        ["set", "@entity.pageSize", "@config.defaultPageSize"]
      ]},
      {"event": "NEXT_PAGE",
       "guard": ["<", "@entity.page", ["math/ceil", ["/", "@entity.totalItems", "@entity.pageSize"]]],
       "effects": [["set", "@entity.page", ["+", "@entity.page", 1]]]},
      {"event": "PREV_PAGE",
       "guard": [">", "@entity.page", 1],
       "effects": [["set", "@entity.page", ["-", "@entity.page", 1]]]},
      {"event": "GO_TO_PAGE",
       "guard": ["and",
         [">=", "@payload.page", 1],
         ["<=", "@payload.page", ["math/ceil", ["/", "@entity.totalItems", "@entity.pageSize"]]]],
       "effects": [["set", "@entity.page", "@payload.page"]]},
      {"event": "SET_PAGE_SIZE", "effects": [
        ["set", "@entity.pageSize", "@payload.size"],
        ["set", "@entity.page", 1]
      ]},
      {"event": "SET_TOTAL", "effects": [["set", "@entity.totalItems", "@payload.total"]]}
    ]
  },
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "defaultPageSize", "type": "number", "description": "Default items per page", "default": 20},
      {"name": "pageSizeOptions", "type": "array", "description": "Available page sizes", "default": [10, 20, 50, 100]}
    ]
  }
})json";

constexpr std::string_view k_selection = R"json({
  "name": "std/Selection",
  "category": "data-management",
  "description": "Single or multi-selection management",
  "suggestedFor": ["Multi-select lists", "Bulk operations", "Item picking", "Checkboxes in tables"],
  "dataEntities": [
    {"name": "SelectionState", "runtime": true, "singleton": true, "fields": [
      {"name": "selected", "type": "array", "default": []},
      {"name": "lastSelected", "type": "string", "default": null}
    ]}
  ],
  "stateMachine": {
    "initial": "Active",
    "states": [{"name": "Active", "isInitial": true}],
    "events": [{"key": "INIT"}, {"key": "SELECT"}, {"key": "DESELECT"}, {"key": "TOGGLE"},
               {"key": "SELECT_ALL"}, {"key": "CLEAR"}],
    "transitions": [
      {"from": "*", "event": "INIT", "effects": [
        ["set", "@entity.selected", []],
        ["set", "@entity.lastSelected", null]
      ]},
      {"event": "SELECT", "effects": [
        ["if", ["=", "@config.mode", "single"],
          ["do",
            ["set", "@entity.selected", ["array/append", [], "@payload.id"]],
            ["set", "@entity.lastSelected", "@payload.id"]],
          ["if", ["or",
              ["not", "@config.maxSelection"],
              ["<", ["array/len", "@entity.selected"], "@config.maxSelection"]],
            ["do",
              ["set", "@entity.selected", ["array/append", "@entity.selected", "@payload.id"]],
              ["set", "@entity.lastSelected", "@payload.id"]],
            ["notify", "Maximum selection reached", "warning"]]]
      ]},
      {"event": "DESELECT", "effects": [
        ["set", "@entity.selected", ["array/filter", "@entity.selected", ["fn", "id", ["!=", "@id", "@payload.id"]]]]
      ]},
      {"event": "TOGGLE", "effects": [
        ["if", ["array/includes", "@entity.selected", "@payload.id"],
          ["set", "@entity.selected", ["array/filter", "@entity.selected", ["fn", "id", ["!=", "@id", "@payload.id"]]]],
          ["if", ["or",
              ["=", "@config.mode", "single"],
              ["not", "@config.maxSelection"],
              ["<", ["array/len", "@entity.selected"], "@config.maxSelection"]],
            ["set", "@entity.selected",
              ["if", ["=", "@config.mode", "single"],
                ["array/append", [], "@payload.id"],
                ["array/append", "@entity.selected", "@payload.id"]]],
            ["notify", "Maximum selection reached", "warning"]]]
      ]},
      {"event": "SELECT_ALL", "guard": ["=", "@config.mode", "multi"], "effects": [
        ["set", "@entity.selected", "@payload.ids"]
      ]},
      {"event": "CLEAR", "effects": [
        ["set", "@entity.selected", []],
        ["set", "@entity.lastSelected", null]
      ]}
    ]
  },
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "mode", "type": "string", "description": "Selection mode", "default": "single", "enum": ["single", "multi"]},
      {"name": "maxSelection", "type": "number", "description": "Maximum selections (multi mode)", "default": null}
    ]
  }
})json";

constexpr std::string_view k_sort = R"json({
  "name": "std/Sort",
  "category": "data-management",
  "description": "Sorting by field with direction toggle",
  "suggestedFor": ["Sortable tables", "List ordering", "Column headers"],
  "dataEntities": [
    {"name": "SortState", "runtime": true, "singleton": true, "fields": [
      {"name": "sortField", "type": "string", "default": null},
      {"name": "sortDirection", "type": "string", "default": "asc"}
    ]}
  ],
  "stateMachine": {
    "initial": "Active",
    "states": [{"name": "Active", "isInitial": true}],
    "events": [{"key": "INIT"}, {"key": "SORT"}, {"key": "TOGGLE_DIRECTION"}, {"key": "CLEAR_SORT"}],
    "transitions": [
      {"from": "*", "event": "INIT", "effects": [
        ["set", "@entity.sortField", "@config.defaultField"],
        ["set", "@entity.sortDirection", "@config.defaultDirection"]
      ]},
      {"event": "SORT", "effects": [
        ["if", ["=", "@entity.sortField", "@payload.field"],
          ["set", "@entity.sortDirection", ["if", ["=", "@entity.sortDirection", "asc"], "desc", "asc"]],
          ["do",
            ["set", "@entity.sortField", "@payload.field"],
            ["set", "@entity.sortDirection", "asc"]]]
      ]},
      {"event": "TOGGLE_DIRECTION", "guard": ["!=", "@entity.sortField", null], "effects": [
        ["set", "@entity.sortDirection", ["if", ["=", "@entity.sortDirection", "asc"], "desc", "asc"]]
      ]},
      {"event": "CLEAR_SORT", "effects": [
        ["set", "@entity.sortField", null],
        ["set", "@entity.sortDirection", "asc"]
      ]}
    ]
  },
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "defaultField", "type": "string", "description": "Default sort field", "default": null},
      {"name": "defaultDirection", "type": "string", "description": "Default direction", "default": "asc", "enum": ["asc", "desc"]}
    ]
  }
})json";

constexpr std::string_view k_filter = R"json({
  "name": "std/Filter",
  "category": "data-management",
  "description": "Query state for explicit filtering of an entity table",
  "suggestedFor": ["Filterable lists", "Advanced search", "Filter panels", "Faceted search", "Entity tables with filters"],
  "dataEntities": [
    {"name": "QueryState", "runtime": true, "singleton": true, "fields": [
      {"name": "status", "type": "string", "default": null, "description": "Filter by status field"},
      {"name": "priority", "type": "string", "default": null, "description": "Filter by priority field"},
      {"name": "search", "type": "string", "default": "", "description": "Search term"},
      {"name": "sortBy", "type": "string", "default": "createdAt", "description": "Sort field"},
      {"name": "sortOrder", "type": "string", "default": "desc", "description": "Sort direction: asc or desc"}
    ]}
  ],
  "stateMachine": {
    "initial": "Active",
    "states": [{"name": "Active", "isInitial": true}],
    "events": [{"key": "INIT"}, {"key": "FILTER"}, {"key": "SEARCH"}, {"key": "SORT"}, {"key": "CLEAR_FILTERS"}],
    "transitions": [
      {"from": "*", "event": "INIT", "effects": [
        ["render-ui", "sidebar", {"type": "filter-group"},
          ["object/set", ["object/set", {}, "query", "@entity"], "filters", "@config.filters"]],
        ["render-ui", "main", {"type": "entity-table"},
          ["object/set", ["object/set", ["object/set", {}, "entity", "@config.entity"], "query", "@entity"], "columns", "@config.columns"]]
      ]},
      {"event": "FILTER", "effects": [
        ["set", "@entity.status", "@payload.status"],
        ["set", "@entity.priority", "@payload.priority"]
      ]},
      {"event": "SEARCH", "effects": [["set", "@entity.search", "@payload.searchTerm"]]},
      {"event": "SORT", "effects": [
        ["set", "@entity.sortBy", "@payload.field"],
        ["set", "@entity.sortOrder", "@payload.order"]
      ]},
      {"event": "CLEAR_FILTERS", "effects": [
        ["set", "@entity.status", null],
        ["set", "@entity.priority", null],
        ["set", "@entity.search", ""]
      ]}
    ]
  },
  "configSchema": {
    "required": [{"name": "entity", "type": "string", "description": "Entity to filter"}],
    "optional": [
      {"name": "filters", "type": "array", "description": "Filter field definitions", "default": []},
      {"name": "columns", "type": "array", "description": "Table columns to display", "default": []}
    ]
  }
})json";

constexpr std::string_view k_search = R"json({
  "name": "std/Search",
  "category": "data-management",
  "description": "Search with debounce",
  "suggestedFor": ["Search inputs", "Quick filters", "Global search", "Type-ahead"],
  "dataEntities": [
    {"name": "SearchState", "runtime": true, "singleton": true, "fields": [
      {"name": "search", "type": "string", "default": ""},
      {"name": "isSearching", "type": "boolean", "default": false}
    ]}
  ],
  "stateMachine": {
    "initial": "Idle",
    "states": [{"name": "Idle", "isInitial": true}, {"name": "Searching"}],
    "events": [{"key": "INIT"}, {"key": "SEARCH"}, {"key": "CLEAR_SEARCH"}, {"key": "SEARCH_COMPLETE"}],
    "transitions": [
      {"from": "*", "event": "INIT", "effects": [
        ["set", "@entity.search", ""],
        ["set", "@entity.isSearching", false],
        ["render-ui", "main", {"type": "search-bar"},
          ["object/set", ["object/set", {}, "query", "@entity"], "placeholder", "@config.placeholder"]]
      ]},
      {"from": "Idle", "to": "Searching", "event": "SEARCH",
       "guard": [">=", ["str/len", "@payload.term"], "@config.minLength"],
       "effects": [
        ["set", "@entity.search", "@payload.term"],
        ["set", "@entity.isSearching", true],
        ["async/debounce", "SEARCH_COMPLETE", "@config.debounceMs"]
      ]},
      {"from": "Idle", "event": "SEARCH",
       "guard": ["<", ["str/len", "@payload.term"], "@config.minLength"],
       "effects": [["set", "@entity.search", "@payload.term"]]},
      {"from": "Searching", "event": "SEARCH",
       "effects": [
        ["set", "@entity.search", "@payload.term"],
        ["async/debounce", "SEARCH_COMPLETE", "@config.debounceMs"]
      ]},
      {"from": "Searching", "to": "Idle", "event": "SEARCH_COMPLETE", "effects": [
        ["set", "@entity.isSearching", false]
      ]},
      {"to": "Idle", "event": "CLEAR_SEARCH", "effects": [
        ["set", "@entity.search", ""],
        ["set", "@entity.isSearching", false]
      ]}
    ]
  },
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "debounceMs", "type": "number", "description": "Debounce delay in ms", "default": 300},
      {"name": "minLength", "type": "number", "description": "Minimum search length", "default": 1},
      {"name": "placeholder", "type": "string", "description": "Input placeholder", "default": "Search..."}
    ]
  }
})json";

// async

constexpr std::string_view k_loading = R"json({
  "name": "std/Loading",
  "category": "async",
  "description": "Loading state management with success/error handling",
  "suggestedFor": ["Async data loading", "API calls", "Resource fetching", "Initial page load"],
  "dataEntities": [
    {"name": "LoadingState", "runtime": true, "singleton": true, "fields": [
      {"name": "isLoading", "type": "boolean", "default": false},
      {"name": "error", "type": "object", "default": null},
      {"name": "data", "type": "object", "default": null},
      {"name": "startTime", "type": "number", "default": null}
    ]}
  ],
  "stateMachine": {
    "initial": "Idle",
    "states": [{"name": "Idle", "isInitial": true}, {"name": "Loading"}, {"name": "Success"}, {"name": "Error"}],
    "events": [{"key": "START"}, {"key": "SUCCESS"}, {"key": "ERROR"}, {"key": "RETRY"}, {"key": "RESET"}],
    "transitions": [
      {"from": "Idle", "to": "Loading", "event": "START", "effects": [
        ["set", "@entity.isLoading", true],
        ["set", "@entity.error", null],
        ["set", "@entity.startTime", ["time/now"]],
        ["render-ui", "content", {"type": "loading-state"}]
      ]},
      {"from": "Loading", "to": "Success", "event": "SUCCESS", "effects": [
        ["set", "@entity.isLoading", false],
        ["set", "@entity.data", "@payload.data"],
        ["render-ui", "content", null]
      ]},
      {"from": "Loading", "to": "Error", "event": "ERROR", "effects": [
        ["set", "@entity.isLoading", false],
        ["set", "@entity.error", "@payload.error"],
        ["render-ui", "content", {"type": "error-state", "onRetry": "RETRY"}, ["object/set", {}, "error", "@payload.error"]]
      ]},
      {"from": "Error", "to": "Loading", "event": "RETRY", "effects": [
        ["set", "@entity.isLoading", true],
        ["set", "@entity.error", null],
        ["set", "@entity.startTime", ["time/now"]],
        ["render-ui", "content", {"type": "loading-state"}]
      ]},
      {"from": ["Success", "Error"], "to": "Idle", "event": "RESET", "effects": [
        ["set", "@entity.isLoading", false],
        ["set", "@entity.error", null],
        ["set", "@entity.data", null]
      ]}
    ]
  },
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "showLoadingAfterMs", "type": "number", "description": "Delay before showing loading", "default": 200},
      {"name": "minLoadingMs", "type": "number", "description": "Minimum loading display time", "default": 500}
    ]
  }
})json";

constexpr std::string_view k_fetch = R"json({
  "name": "std/Fetch",
  "category": "async",
  "description": "Data fetching with caching and refresh capabilities",
  "suggestedFor": ["API data fetching", "Entity loading", "Remote data", "Cached queries"],
  "dataEntities": [
    {"name": "FetchState", "runtime": true, "singleton": true, "fields": [
      {"name": "data", "type": "object", "default": null},
      {"name": "error", "type": "object", "default": null},
      {"name": "isFetching", "type": "boolean", "default": false},
      {"name": "lastFetchedAt", "type": "number", "default": null}
    ]}
  ],
  "stateMachine": {
    "initial": "Idle",
    "states": [{"name": "Idle", "isInitial": true}, {"name": "Fetching"}, {"name": "Stale"}, {"name": "Fresh"}, {"name": "Error"}],
    "events": [{"key": "FETCH"}, {"key": "FETCH_SUCCESS"}, {"key": "FETCH_ERROR"}, {"key": "REFRESH"}, {"key": "INVALIDATE"}],
    "transitions": [
      {"from": ["Idle", "Stale"], "to": "Fetching", "event": "FETCH", "effects": [
        ["set", "@entity.isFetching", true],
        ["set", "@entity.error", null]
      ]},
      {"from": "Fetching", "to": "Fresh", "event": "FETCH_SUCCESS", "effects": [
        ["set", "@entity.isFetching", false],
        ["set", "@entity.data", "@payload.data"],
        ["set", "@entity.lastFetchedAt", ["time/now"]]
      ]},
      {"from": "Fetching", "to": "Error", "event": "FETCH_ERROR", "effects": [
        ["set", "@entity.isFetching", false],
        ["set", "@entity.error", "@payload.error"]
      ]},
      {"from": "Fresh", "to": "Stale", "event": "INVALIDATE", "effects": [
        ["set", "@entity.lastFetchedAt", null]
      ]},
      {"from": ["Fresh", "Stale", "Error"], "to": "Fetching", "event": "REFRESH", "effects": [
        ["set", "@entity.isFetching", true],
        ["set", "@entity.error", null]
      ]}
    ]
  },
  "ticks": [
    {"name": "StaleCheck", "interval": 1000, "appliesTo": ["Fresh"],
     "guard": [">=", ["-", "@now", "@entity.lastFetchedAt"], "@config.staleTimeMs"],
     "effects": [["emit", "INVALIDATE"]]}
  ],
  "configSchema": {
    "required": [{"name": "entity", "type": "entity", "description": "Entity type to fetch"}],
    "optional": [
      {"name": "staleTimeMs", "type": "number", "description": "Time until data is stale", "default": 60000},
      {"name": "cacheKey", "type": "string", "description": "Cache key for deduplication"}
    ]
  }
})json";

constexpr std::string_view k_submit = R"json({
  "name": "std/Submit",
  "category": "async",
  "description": "Async submission with retry capabilities",
  "suggestedFor": ["Form submission", "Data saving", "API mutations", "Actions with confirmation"],
  "dataEntities": [
    {"name": "SubmitState", "runtime": true, "singleton": true, "fields": [
      {"name": "isSubmitting", "type": "boolean", "default": false},
      {"name": "error", "type": "object", "default": null},
      {"name": "lastSubmittedData", "type": "object", "default": null}
    ]}
  ],
  "stateMachine": {
    "initial": "Idle",
    "states": [{"name": "Idle", "isInitial": true}, {"name": "Submitting"}, {"name": "Success"}, {"name": "Error"}],
    "events": [{"key": "SUBMIT"}, {"key": "SUBMIT_SUCCESS"}, {"key": "SUBMIT_ERROR"}, {"key": "RETRY"}, {"key": "RESET"}],
    "transitions": [
      {"from": "Idle", "to": "Submitting", "event": "SUBMIT", "effects": [
        ["set", "@entity.isSubmitting", true],
        ["set", "@entity.error", null],
        ["set", "@entity.lastSubmittedData", "@payload.data"]
      ]},
      {"from": "Submitting", "to": "Success", "event": "SUBMIT_SUCCESS", "effects": [
        ["set", "@entity.isSubmitting", false],
        ["notify", "@config.successMessage", "success"],
        ["when", "@config.resetOnSuccess", ["emit", "RESET"]]
      ]},
      {"from": "Submitting", "to": "Error", "event": "SUBMIT_ERROR", "effects": [
        ["set", "@entity.isSubmitting", false],
        ["set", "@entity.error", "@payload.error"],
        ["notify", "@config.errorMessage", "error"]
      ]},
      {"from": "Error", "to": "Submitting", "event": "RETRY", "effects": [
        ["set", "@entity.isSubmitting", true],
        ["set", "@entity.error", null]
      ]},
      {"from": ["Success", "Error"], "to": "Idle", "event": "RESET", "effects": [
        ["set", "@entity.isSubmitting", false],
        ["set", "@entity.error", null],
        ["set", "@entity.lastSubmittedData", null]
      ]}
    ]
  },
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "successMessage", "type": "string", "description": "Success notification", "default": "Saved successfully"},
      {"name": "errorMessage", "type": "string", "description": "Error notification", "default": "Failed to save"},
      {"name": "resetOnSuccess", "type": "boolean", "description": "Reset to idle on success", "default": false}
    ]
  }
})json";

constexpr std::string_view k_retry = R"json({
  "name": "std/Retry",
  "category": "async",
  "description": "Automatic retry with exponential backoff",
  "suggestedFor": ["Network requests", "Unreliable operations", "Transient failures", "Recovery logic"],
  "dataEntities": [
    {"name": "RetryState", "runtime": true, "singleton": true, "fields": [
      {"name": "attempt", "type": "number", "default": 0},
      {"name": "error", "type": "object", "default": null},
      {"name": "nextRetryAt", "type": "number", "default": null}
    ]}
  ],
  "stateMachine": {
    "initial": "Idle",
    "states": [{"name": "Idle", "isInitial": true}, {"name": "Attempting"}, {"name": "Waiting"},
               {"name": "Success", "isFinal": true}, {"name": "Failed", "isFinal": true}],
    "events": [{"key": "START"}, {"key": "ATTEMPT_SUCCESS"}, {"key": "ATTEMPT_ERROR"}, {"key": "RETRY_TICK"},
               {"key": "GIVE_UP"}, {"key": "RESET"}],
    "transitions": [
      {"from": "Idle", "to": "Attempting", "event": "START", "effects": [
        ["set", "@entity.attempt", 1],
        ["set", "@entity.error", null]
      ]},
      {"from": "Attempting", "to": "Success", "event": "ATTEMPT_SUCCESS", "effects": []},
      {"from": "Attempting", "to": "Waiting", "event": "ATTEMPT_ERROR",
       "guard": ["<", "@entity.attempt", "@config.maxAttempts"],
       "effects": [
        ["set", "@entity.error", "@payload.error"],
        ["let", [["delay", ["math/min",
            ["*", "@config.initialDelayMs", ["math/pow", "@config.backoffMultiplier", ["-", "@entity.attempt", 1]]],
            "@config.maxDelayMs"]]],
          ["set", "@entity.nextRetryAt", ["+", "@now", "@delay"]]]
      ]},
      {"from": "Attempting", "to": "Failed", "event": "ATTEMPT_ERROR",
       "guard": [">=", "@entity.attempt", "@config.maxAttempts"],
       "effects": [
        ["set", "@entity.error", "@payload.error"],
        ["notify", "All retry attempts failed", "error"]
      ]},
      {"from": "Waiting", "to": "Attempting", "event": "RETRY_TICK", "effects": [
        ["set", "@entity.attempt", ["+", "@entity.attempt", 1]],
        ["set", "@entity.nextRetryAt", null]
      ]},
      {"from": "Waiting", "to": "Failed", "event": "GIVE_UP", "effects": [
        ["notify", "Retry cancelled", "warning"]
      ]},
      {"from": ["Success", "Failed"], "to": "Idle", "event": "RESET", "effects": [
        ["set", "@entity.attempt", 0],
        ["set", "@entity.error", null],
        ["set", "@entity.nextRetryAt", null]
      ]}
    ]
  },
  "ticks": [
    {"name": "RetryTimer", "interval": "frame", "appliesTo": ["Waiting"],
     "guard": ["and", "@entity.nextRetryAt", [">=", "@now", "@entity.nextRetryAt"]],
     "effects": [["emit", "RETRY_TICK"]]}
  ],
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "maxAttempts", "type": "number", "description": "Maximum retry attempts", "default": 3},
      {"name": "initialDelayMs", "type": "number", "description": "Initial retry delay", "default": 1000},
      {"name": "maxDelayMs", "type": "number", "description": "Maximum retry delay", "default": 30000},
      {"name": "backoffMultiplier", "type": "number", "description": "Backoff multiplier", "default": 2}
    ]
  }
})json";

constexpr std::string_view k_poll = R"json({
  "name": "std/Poll",
  "category": "async",
  "description": "Periodic polling with start/stop control",
  "suggestedFor": ["Real-time updates", "Status checking", "Live data", "Notification polling"],
  "dataEntities": [
    {"name": "PollState", "runtime": true, "singleton": true, "fields": [
      {"name": "isPolling", "type": "boolean", "default": false},
      {"name": "pollCount", "type": "number", "default": 0},
      {"name": "lastPollAt", "type": "number", "default": null},
      {"name": "error", "type": "object", "default": null}
    ]}
  ],
  "stateMachine": {
    "initial": "Stopped",
    "states": [{"name": "Stopped", "isInitial": true}, {"name": "Polling"}, {"name": "Paused"}],
    "events": [{"key": "START"}, {"key": "STOP"}, {"key": "PAUSE"}, {"key": "RESUME"},
               {"key": "POLL_TICK"}, {"key": "POLL_SUCCESS"}, {"key": "POLL_ERROR"}],
    "transitions": [
      {"from": "Stopped", "to": "Polling", "event": "START", "effects": [
        ["set", "@entity.isPolling", true],
        ["set", "@entity.pollCount", 0]
      ]},
      {"from": "Polling", "event": "POLL_TICK",
       "guard": ["or", ["=", "@config.maxPolls", null], ["<", "@entity.pollCount", "@config.maxPolls"]],
       "effects": [
        ["set", "@entity.lastPollAt", "@now"],
        ["emit", "POLL_REQUESTED"]
      ]},
      {"from": "Polling", "event": "POLL_SUCCESS", "effects": [
        ["set", "@entity.pollCount", ["+", "@entity.pollCount", 1]],
        ["set", "@entity.error", null]
      ]},
      {"from": "Polling", "event": "POLL_ERROR", "effects": [
        ["set", "@entity.error", "@payload.error"],
        ["when", "@config.stopOnError", ["emit", "STOP"]]
      ]},
      {"from": "Polling", "to": "Paused", "event": "PAUSE", "effects": [["set", "@entity.isPolling", false]]},
      {"from": "Paused", "to": "Polling", "event": "RESUME", "effects": [["set", "@entity.isPolling", true]]},
      {"from": ["Polling", "Paused"], "to": "Stopped", "event": "STOP", "effects": [["set", "@entity.isPolling", false]]}
    ]
  },
  "ticks": [
    {"name": "PollInterval", "interval": "@config.intervalMs", "appliesTo": ["Polling"],
     "effects": [["emit", "POLL_TICK"]]}
  ],
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "intervalMs", "type": "number", "description": "Poll interval in ms", "default": 5000},
      {"name": "stopOnError", "type": "boolean", "description": "Stop polling on error", "default": false},
      {"name": "maxPolls", "type": "number", "description": "Maximum poll count (null = infinite)", "default": null}
    ]
  }
})json";

// feedback

constexpr std::string_view k_notification = R"json({
  "name": "std/Notification",
  "category": "feedback",
  "description": "Toast notification with auto-dismiss",
  "suggestedFor": ["Success messages", "Error alerts", "Status updates", "User feedback"],
  "dataEntities": [
    {"name": "NotificationState", "runtime": true, "singleton": true, "fields": [
      {"name": "notifications", "type": "array", "default": []},
      {"name": "currentId", "type": "number", "default": 0}
    ]}
  ],
  "stateMachine": {
    "initial": "Hidden",
    "states": [{"name": "Hidden", "isInitial": true}, {"name": "Visible"}],
    "events": [{"key": "SHOW"}, {"key": "HIDE"}, {"key": "DISMISS"}],
    "transitions": [
      {"to": "Visible", "event": "SHOW", "effects": [
        ["let", [["id", ["+", "@entity.currentId", 1]]],
          ["do",
            ["set", "@entity.currentId", "@id"],
            ["set", "@entity.notifications",
              ["array/takeLast",
                ["array/append", "@entity.notifications",
                  ["object/merge",
                    ["object/pick", "@payload", ["array/append", ["array/append", ["array/append", [], "type"], "message"], "title"]],
                    ["object/set", ["object/set", {}, "id", "@id"], "expiresAt",
                      ["if", [">", "@config.autoDismissMs", 0], ["+", "@now", "@config.autoDismissMs"], null]]]],
                "@config.maxVisible"]]]]
      ]},
      {"from": "Visible", "event": "DISMISS", "effects": [
        ["set", "@entity.notifications",
          ["array/reject", "@entity.notifications", ["fn", "n", ["=", "@n.id", "@payload.id"]]]],
        ["when", ["array/empty?", "@entity.notifications"], ["emit", "HIDE"]]
      ]},
      {"to": "Hidden", "event": "HIDE", "effects": [["set", "@entity.notifications", []]]}
    ]
  },
  "ticks": [
    {"name": "AutoDismiss", "interval": 100, "appliesTo": ["Visible"],
     "guard": ["array/some", "@entity.notifications", ["fn", "n", ["and", "@n.expiresAt", ["<=", "@n.expiresAt", "@now"]]]],
     "effects": [
      ["set", "@entity.notifications",
        ["array/reject", "@entity.notifications", ["fn", "n", ["and", "@n.expiresAt", ["<=", "@n.expiresAt", "@now"]]]]],
      ["when", ["array/empty?", "@entity.notifications"], ["emit", "HIDE"]]
    ]}
  ],
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "autoDismissMs", "type": "number", "description": "Auto dismiss delay (0 = no auto)", "default": 5000},
      {"name": "position", "type": "string", "description": "Toast position", "default": "top-right",
       "enum": ["top-left", "top-center", "top-right", "bottom-left", "bottom-center", "bottom-right"]},
      {"name": "maxVisible", "type": "number", "description": "Maximum visible notifications", "default": 5}
    ]
  }
})json";

constexpr std::string_view k_confirmation = R"json({
  "name": "std/Confirmation",
  "category": "feedback",
  "description": "Confirmation dialog with confirm/cancel actions",
  "suggestedFor": ["Delete confirmation", "Destructive actions", "Important decisions", "Exit warnings"],
  "dataEntities": [
    {"name": "ConfirmationState", "runtime": true, "singleton": true, "fields": [
      {"name": "title", "type": "string", "default": ""},
      {"name": "message", "type": "string", "default": ""},
      {"name": "pendingAction", "type": "object", "default": null}
    ]}
  ],
  "stateMachine": {
    "initial": "Closed",
    "states": [{"name": "Closed", "isInitial": true}, {"name": "Open"}],
    "events": [{"key": "REQUEST"}, {"key": "CONFIRM"}, {"key": "CANCEL"}],
    "transitions": [
      {"from": "Closed", "to": "Open", "event": "REQUEST", "effects": [
        ["set", "@entity.title", "@payload.title"],
        ["set", "@entity.message", "@payload.message"],
        ["set", "@entity.pendingAction", "@payload.onConfirm"],
        ["render-ui", "modal", {"type": "confirmation"},
          ["object/merge", "@payload", ["object/pick", "@config", ["array/append", ["array/append", ["array/append", [], "confirmLabel"], "cancelLabel"], "confirmVariant"]]]]
      ]},
      {"from": "Open", "to": "Closed", "event": "CONFIRM", "effects": [
        ["render-ui", "modal", null],
        ["when", "@entity.pendingAction", ["emit", "@entity.pendingAction.event", "@entity.pendingAction.payload"]],
        ["set", "@entity.pendingAction", null]
      ]},
      {"from": "Open", "to": "Closed", "event": "CANCEL", "effects": [
        ["render-ui", "modal", null],
        ["set", "@entity.pendingAction", null]
      ]}
    ]
  },
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "confirmLabel", "type": "string", "description": "Confirm button label", "default": "Confirm"},
      {"name": "cancelLabel", "type": "string", "description": "Cancel button label", "default": "Cancel"},
      {"name": "confirmVariant", "type": "string", "description": "Confirm button variant", "default": "primary",
       "enum": ["primary", "danger", "warning"]}
    ]
  }
})json";

constexpr std::string_view k_undo = R"json({
  "name": "std/Undo",
  "category": "feedback",
  "description": "Undo/redo stack for reversible actions",
  "suggestedFor": ["Document editing", "Form changes", "Canvas operations", "Reversible actions"],
  "dataEntities": [
    {"name": "UndoState", "runtime": true, "singleton": true, "fields": [
      {"name": "undoStack", "type": "array", "default": []},
      {"name": "redoStack", "type": "array", "default": []}
    ]}
  ],
  "stateMachine": {
    "initial": "Ready",
    "states": [{"name": "Ready", "isInitial": true}],
    "events": [{"key": "PUSH"}, {"key": "UNDO"}, {"key": "REDO"}, {"key": "CLEAR"}],
    "transitions": [
      {"event": "PUSH", "effects": [
        ["set", "@entity.undoStack", ["array/slice", ["array/prepend", "@entity.undoStack", "@payload"], 0, "@config.maxHistory"]],
        ["set", "@entity.redoStack", []],
        ["when", "@config.showToast",
          ["notify", ["str/template", "{description} - Click to undo", "@payload"], "info"]]
      ]},
      {"event": "UNDO", "guard": [">", ["array/len", "@entity.undoStack"], 0], "effects": [
        ["let", [["action", ["array/first", "@entity.undoStack"]]],
          ["do",
            ["set", "@entity.undoStack", ["array/slice", "@entity.undoStack", 1]],
            ["set", "@entity.redoStack", ["array/prepend", "@entity.redoStack", "@action"]],
            ["emit", "@action.reverseAction", "@action.reverseData"]]]
      ]},
      {"event": "REDO", "guard": [">", ["array/len", "@entity.redoStack"], 0], "effects": [
        ["let", [["action", ["array/first", "@entity.redoStack"]]],
          ["do",
            ["set", "@entity.redoStack", ["array/slice", "@entity.redoStack", 1]],
            ["set", "@entity.undoStack", ["array/prepend", "@entity.undoStack", "@action"]],
            ["emit", "@action.action", "@action.data"]]]
      ]},
      {"event": "CLEAR", "effects": [
        ["set", "@entity.undoStack", []],
        ["set", "@entity.redoStack", []]
      ]}
    ]
  },
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "maxHistory", "type": "number", "description": "Maximum undo history", "default": 50},
      {"name": "showToast", "type": "boolean", "description": "Show undo toast", "default": true},
      {"name": "toastDurationMs", "type": "number", "description": "Toast display duration", "default": 5000}
    ]
  }
})json";

// ui-interaction

constexpr std::string_view k_modal = R"json({
  "name": "std/Modal",
  "category": "ui-interaction",
  "description": "Modal dialog with open/close state management",
  "suggestedFor": ["Confirmation dialogs", "Create forms", "Detail views", "Any overlay content"],
  "dataEntities": [
    {"name": "ModalState", "runtime": true, "fields": [
      {"name": "content", "type": "object", "default": null}
    ]}
  ],
  "stateMachine": {
    "initial": "Closed",
    "states": [{"name": "Closed", "isInitial": true}, {"name": "Open"}],
    "events": [{"key": "OPEN"}, {"key": "CLOSE"}, {"key": "CONFIRM"}],
    "transitions": [
      {"from": "Closed", "to": "Open", "event": "OPEN", "effects": [
        ["set", "@entity.content", "@payload.content"],
        ["render-ui", "modal", ["object/set", ["object/set", {"onClose": "CLOSE"}, "type", "@payload.type"], "size", "@config.size"],
          "@payload.content"]
      ]},
      {"from": "Open", "to": "Closed", "event": "CLOSE", "effects": [
        ["set", "@entity.content", null],
        ["render-ui", "modal", null]
      ]},
      {"from": "Open", "to": "Closed", "event": "CONFIRM", "effects": [
        ["set", "@entity.content", null],
        ["render-ui", "modal", null]
      ]}
    ]
  },
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "size", "type": "string", "description": "Modal size", "default": "md", "enum": ["sm", "md", "lg", "xl", "full"]},
      {"name": "closeOnOverlay", "type": "boolean", "description": "Close on overlay click", "default": true},
      {"name": "closeOnEscape", "type": "boolean", "description": "Close on escape key", "default": true}
    ]
  }
})json";

constexpr std::string_view k_tabs = R"json({
  "name": "std/Tabs",
  "category": "ui-interaction",
  "description": "Tabbed navigation within a page",
  "suggestedFor": ["Multi-view pages", "Settings with sections", "Dashboard tabs", "Profile sections"],
  "dataEntities": [
    {"name": "TabsState", "runtime": true, "singleton": true, "fields": [
      {"name": "activeTab", "type": "string", "default": null}
    ]}
  ],
  "stateMachine": {
    "initial": "Active",
    "states": [{"name": "Active", "isInitial": true}],
    "events": [{"key": "INIT"}, {"key": "SELECT_TAB"}],
    "transitions": [
      {"from": "Active", "to": "Active", "event": "INIT", "effects": [
        ["set", "@entity.activeTab", ["math/default", "@config.defaultTab", ["object/get", ["array/first", "@config.tabs"], "id"]]],
        ["render-ui", "main", {"type": "filter-group", "filterType": "tabs", "onSelect": "SELECT_TAB"},
          ["object/set", ["object/set", {}, "tabs", "@config.tabs"], "active", "@entity.activeTab"]]
      ]},
      {"from": "Active", "to": "Active", "event": "SELECT_TAB",
       "guard": ["array/some", "@config.tabs", ["fn", "tab", ["=", "@tab.id", "@payload.tabId"]]],
       "effects": [["set", "@entity.activeTab", "@payload.tabId"]]}
    ]
  },
  "initialEffects": [["emit", "INIT"]],
  "configSchema": {
    "required": [{"name": "tabs", "type": "array", "description": "Tab definitions with id, label, content"}],
    "optional": [{"name": "defaultTab", "type": "string", "description": "Default active tab ID"}]
  }
})json";

constexpr std::string_view k_wizard = R"json({
  "name": "std/Wizard",
  "category": "ui-interaction",
  "description": "Multi-step wizard flow - each step is a state",
  "suggestedFor": ["Onboarding flows", "Multi-step forms", "Setup wizards", "Checkout flows"],
  "dataEntities": [
    {"name": "WizardState", "runtime": true, "singleton": true, "fields": [
      {"name": "stepData", "type": "object", "default": {}}
    ]}
  ],
  "stateMachine": {
    "initial": "Step1",
    "states": [{"name": "Step1", "isInitial": true}, {"name": "Step2"}, {"name": "Step3"}, {"name": "Complete", "isFinal": true}],
    "events": [{"key": "INIT"}, {"key": "NEXT"}, {"key": "PREV"}, {"key": "COMPLETE"}],
    "transitions": [
      {"from": "Step1", "to": "Step1", "event": "INIT", "effects": [
        ["render-ui", "main", {"type": "wizard-progress", "steps": ["Step 1", "Step 2", "Step 3"], "current": 0}],
        ["render-ui", "main", {"type": "form-section", "submitEvent": "NEXT"}, ["object/set", {}, "fields", "@config.step1Fields"]]
      ]},
      {"from": "Step1", "to": "Step2", "event": "NEXT", "effects": [
        ["set", "@entity.stepData.step1", "@payload"],
        ["render-ui", "main", {"type": "wizard-progress", "steps": ["Step 1", "Step 2", "Step 3"], "current": 1}],
        ["render-ui", "main", {"type": "form-section", "submitEvent": "NEXT", "cancelEvent": "PREV"}, ["object/set", {}, "fields", "@config.step2Fields"]]
      ]},
      {"from": "Step2", "to": "Step1", "event": "PREV", "effects": [["emit", "INIT"]]},
      {"from": "Step2", "to": "Step3", "event": "NEXT", "effects": [
        ["set", "@entity.stepData.step2", "@payload"],
        ["render-ui", "main", {"type": "wizard-progress", "steps": ["Step 1", "Step 2", "Step 3"], "current": 2}],
        ["render-ui", "main", {"type": "form-section", "submitLabel": "Complete", "cancelLabel": "Back",
                               "submitEvent": "COMPLETE", "cancelEvent": "PREV"}]
      ]},
      {"from": "Step3", "to": "Step2", "event": "PREV", "effects": [
        ["render-ui", "main", {"type": "wizard-progress", "steps": ["Step 1", "Step 2", "Step 3"], "current": 1}],
        ["render-ui", "main", {"type": "form-section", "submitEvent": "NEXT", "cancelEvent": "PREV"}, ["object/set", {}, "fields", "@config.step2Fields"]]
      ]},
      {"from": "Step3", "to": "Complete", "event": "COMPLETE", "effects": [
        ["persist", "create", "@entity.stepData"],
        ["notify", "Wizard completed!", "success"],
        ["navigate", "@config.completionUrl"]
      ]}
    ]
  },
  "configSchema": {
    "required": [
      {"name": "entity", "type": "entity", "description": "Entity to create"},
      {"name": "step1Fields", "type": "array", "description": "Fields for step 1"},
      {"name": "step2Fields", "type": "array", "description": "Fields for step 2"}
    ],
    "optional": [
      {"name": "completionUrl", "type": "string", "description": "URL to navigate on completion", "default": "/"}
    ]
  }
})json";

// game

constexpr std::string_view k_health = R"json({
  "name": "std/Health",
  "category": "game-entity",
  "description": "Entity health with damage, healing, invulnerability, and death",
  "suggestedFor": ["Player characters", "Enemies", "Destructible objects", "Bosses"],
  "dataEntities": [
    {"name": "HealthState", "runtime": true, "fields": [
      {"name": "currentHealth", "type": "number", "default": 100},
      {"name": "maxHealth", "type": "number", "default": 100},
      {"name": "isInvulnerable", "type": "boolean", "default": false},
      {"name": "lastDamageTime", "type": "number", "default": 0}
    ]}
  ],
  "stateMachine": {
    "initial": "Alive",
    "states": [{"name": "Alive", "isInitial": true}, {"name": "Damaged"}, {"name": "Invulnerable"}, {"name": "Dead"}],
    "events": [{"key": "INIT"}, {"key": "DAMAGE"}, {"key": "HEAL"}, {"key": "DIE"}, {"key": "RESPAWN"}, {"key": "INVULNERABILITY_END"}],
    "transitions": [
      {"from": "*", "to": "Alive", "event": "INIT", "effects": [
        ["set", "@entity.currentHealth", "@config.maxHealth"],
        ["set", "@entity.maxHealth", "@config.maxHealth"],
        ["set", "@entity.isInvulnerable", false],
        ["when", "@config.showHealthBar",
          ["render-ui", "hud.health", {"type": "health-bar"},
            ["object/set", ["object/set", {}, "current", "@entity.currentHealth"], "max", "@entity.maxHealth"]]]
      ]},
      {"from": "Alive", "to": "Damaged", "event": "DAMAGE", "guard": ["not", "@entity.isInvulnerable"], "effects": [
        ["set", "@entity.currentHealth", ["math/max", 0, ["-", "@entity.currentHealth", "@payload.amount"]]],
        ["set", "@entity.lastDamageTime", "@now"],
        ["if", ["<=", "@entity.currentHealth", 0],
          ["emit", "DIE"],
          ["do",
            ["set", "@entity.isInvulnerable", true],
            ["render-ui", "entity.flash", {"type": "damage-flash"}]]]
      ]},
      {"from": ["Damaged", "Invulnerable"], "to": "Alive", "event": "INVULNERABILITY_END", "effects": [
        ["set", "@entity.isInvulnerable", false]
      ]},
      {"from": ["Alive", "Damaged", "Invulnerable"], "event": "HEAL", "effects": [
        ["set", "@entity.currentHealth", ["math/min", "@entity.maxHealth", ["+", "@entity.currentHealth", "@payload.amount"]]],
        ["render-ui", "entity.effect", {"type": "heal-effect"}]
      ]},
      {"from": ["Alive", "Damaged", "Invulnerable"], "to": "Dead", "event": "DIE", "effects": [
        ["set", "@entity.currentHealth", 0],
        ["emit", "@config.onDeath", ["object/set", {}, "entityId", "@entity.id"]],
        ["render-ui", "entity.sprite", {"type": "death-animation"}]
      ]},
      {"from": "Dead", "to": "Alive", "event": "RESPAWN", "effects": [["emit", "INIT"]]}
    ]
  },
  "ticks": [
    {"name": "InvulnerabilityTimer", "interval": "frame",
     "guard": ["and", "@entity.isInvulnerable", [">", ["-", "@now", "@entity.lastDamageTime"], "@config.invulnerabilityTime"]],
     "effects": [["emit", "INVULNERABILITY_END"]]}
  ],
  "configSchema": {
    "required": [{"name": "maxHealth", "type": "number", "description": "Maximum health points"}],
    "optional": [
      {"name": "invulnerabilityTime", "type": "number", "description": "Invulnerability duration after damage (ms)", "default": 500},
      {"name": "onDeath", "type": "event", "description": "Event to emit on death", "default": "ENTITY_DIED"},
      {"name": "showHealthBar", "type": "boolean", "description": "Render health bar", "default": true}
    ]
  }
})json";

constexpr std::string_view k_score = R"json({
  "name": "std/Score",
  "category": "game-entity",
  "description": "Score tracking with points, combos, and multipliers",
  "suggestedFor": ["Arcade games", "Puzzle games", "Platformers with collectibles", "Competitive games"],
  "dataEntities": [
    {"name": "ScoreState", "runtime": true, "singleton": true, "fields": [
      {"name": "currentScore", "type": "number", "default": 0},
      {"name": "highScore", "type": "number", "default": 0},
      {"name": "comboCount", "type": "number", "default": 0},
      {"name": "multiplier", "type": "number", "default": 1},
      {"name": "lastScoreTime", "type": "number", "default": 0}
    ]}
  ],
  "stateMachine": {
    "initial": "Active",
    "states": [{"name": "Active", "isInitial": true}],
    "events": [{"key": "INIT"}, {"key": "ADD_POINTS"}, {"key": "COMBO_HIT"}, {"key": "COMBO_BREAK"}, {"key": "RESET"}, {"key": "SAVE_HIGH_SCORE"}],
    "transitions": [
      {"from": "*", "event": "INIT", "effects": [
        ["set", "@entity.currentScore", 0],
        ["set", "@entity.comboCount", 0],
        ["set", "@entity.multiplier", 1]
      ]},
      {"event": "ADD_POINTS", "effects": [
        ["set", "@entity.currentScore", ["+", "@entity.currentScore", ["*", "@payload.points", "@entity.multiplier"]]],
        ["set", "@entity.lastScoreTime", "@now"]
      ]},
      {"event": "COMBO_HIT", "effects": [
        ["set", "@entity.comboCount", ["+", "@entity.comboCount", 1]],
        ["set", "@entity.multiplier", ["math/min", "@config.maxMultiplier", ["+", 1, ["math/floor", ["/", "@entity.comboCount", 5]]]]],
        ["set", "@entity.lastScoreTime", "@now"]
      ]},
      {"event": "COMBO_BREAK", "effects": [
        ["set", "@entity.comboCount", 0],
        ["set", "@entity.multiplier", 1]
      ]},
      {"event": "RESET", "effects": [
        ["when", [">", "@entity.currentScore", "@entity.highScore"],
          ["set", "@entity.highScore", "@entity.currentScore"]],
        ["emit", "INIT"]
      ]},
      {"event": "SAVE_HIGH_SCORE", "guard": [">", "@entity.currentScore", "@entity.highScore"], "effects": [
        ["set", "@entity.highScore", "@entity.currentScore"],
        ["when", "@config.persistHighScore",
          ["persist", "update", ["object/set", {}, "highScore", "@entity.highScore"]]]
      ]}
    ]
  },
  "ticks": [
    {"name": "ComboTimeout", "interval": "frame",
     "guard": ["and", [">", "@entity.comboCount", 0], [">", ["-", "@now", "@entity.lastScoreTime"], "@config.comboTimeWindow"]],
     "effects": [["emit", "COMBO_BREAK"]]}
  ],
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "comboTimeWindow", "type": "number", "description": "Time window for combos (ms)", "default": 2000},
      {"name": "maxMultiplier", "type": "number", "description": "Maximum combo multiplier", "default": 10},
      {"name": "persistHighScore", "type": "boolean", "description": "Save high score to storage", "default": true}
    ]
  }
})json";

constexpr std::string_view k_game_loop = R"json({
  "name": "std/GameLoop",
  "category": "game-core",
  "description": "Master game loop coordinator running at 60fps",
  "suggestedFor": ["All real-time games", "Platformers", "Action games", "Endless runners"],
  "dataEntities": [
    {"name": "GameLoopState", "runtime": true, "singleton": true, "fields": [
      {"name": "frameCount", "type": "number", "default": 0},
      {"name": "deltaTime", "type": "number", "default": 16},
      {"name": "elapsedTime", "type": "number", "default": 0}
    ]}
  ],
  "stateMachine": {
    "initial": "Stopped",
    "states": [{"name": "Stopped", "isInitial": true}, {"name": "Running"}, {"name": "Paused"}],
    "events": [{"key": "START"}, {"key": "STOP"}, {"key": "PAUSE"}, {"key": "RESUME"}],
    "transitions": [
      {"from": "Stopped", "to": "Running", "event": "START", "effects": [
        ["set", "@entity.frameCount", 0],
        ["set", "@entity.elapsedTime", 0]
      ]},
      {"from": "Running", "to": "Paused", "event": "PAUSE", "effects": []},
      {"from": "Paused", "to": "Running", "event": "RESUME", "effects": []},
      {"from": ["Running", "Paused"], "to": "Stopped", "event": "STOP", "effects": []}
    ]
  },
  "ticks": [
    {"name": "GameTick", "interval": "frame", "priority": 100, "guard": ["=", "@state", "Running"], "effects": [
      ["set", "@entity.frameCount", ["+", "@entity.frameCount", 1]],
      ["set", "@entity.elapsedTime", ["+", "@entity.elapsedTime", "@entity.deltaTime"]],
      ["emit", "GAME_TICK", ["object/set", ["object/set", {}, "frame", "@entity.frameCount"], "delta", "@entity.deltaTime"]]
    ]}
  ],
  "configSchema": {
    "required": [],
    "optional": [
      {"name": "targetFps", "type": "number", "description": "Target frames per second", "default": 60},
      {"name": "fixedTimestep", "type": "boolean", "description": "Use fixed timestep", "default": true}
    ]
  }
})json";

}  // namespace

const std::vector<std::string_view>& std_behavior_documents() {
    static const std::vector<std::string_view> documents = {
        k_pagination, k_selection, k_sort,   k_filter,       k_search,       k_loading,   k_fetch,
        k_submit,     k_retry,     k_poll,   k_notification, k_confirmation, k_undo,      k_modal,
        k_tabs,       k_wizard,    k_health, k_score,        k_game_loop,
    };
    return documents;
}

}  // namespace behavior
