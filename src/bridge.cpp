#include "bridge.hpp"

#include "serializer.hpp"

namespace webframe::bridge {

namespace {

constexpr std::string_view kInitScript = R"js(
(function () {
  if (window.__webframe_initialized) {
    return;
  }
  window.__webframe_initialized = true;

  var pending = new Map();
  var listeners = new Map();
  var nextId = 1;

  function post(message) {
    var text = JSON.stringify(message);

    if (window.saucer && window.saucer.internal && window.saucer.internal.message) {
      window.saucer.internal.message(text);
    } else if (window.ipc && window.ipc.postMessage) {
      window.ipc.postMessage(text);
    } else if (window.chrome && window.chrome.webview) {
      window.chrome.webview.postMessage(text);
    } else if (window.webkit && window.webkit.messageHandlers && window.webkit.messageHandlers.webframe) {
      window.webkit.messageHandlers.webframe.postMessage(text);
    } else {
      throw new Error('webframe: no native message transport');
    }
  }

  function dispatch(event, payload) {
    var handlers = listeners.get(event);
    if (!handlers) {
      return;
    }
    handlers.slice().forEach(function (handler) {
      try {
        handler(payload);
      } catch (error) {
        console.error('webframe: listener for', event, 'failed:', error);
      }
    });
  }

  Object.defineProperty(window, 'webframe', {
    configurable: false,
    enumerable: false,
    writable: false,
    value: Object.freeze({
      invoke: function (cmd, payload) {
        return new Promise(function (resolve, reject) {
          var id = nextId++;
          pending.set(id, { resolve: resolve, reject: reject });
          try {
            post({ id: id, cmd: cmd, payload: payload === undefined ? null : payload });
          } catch (error) {
            pending.delete(id);
            reject(error);
          }
        });
      },

      listen: function (event, handler) {
        if (!listeners.has(event)) {
          listeners.set(event, []);
        }
        listeners.get(event).push(handler);
        return function () {
          var handlers = listeners.get(event) || [];
          var index = handlers.indexOf(handler);
          if (index >= 0) {
            handlers.splice(index, 1);
          }
        };
      },

      emit: function (event, payload) {
        post({ event: event, payload: payload === undefined ? null : payload });
      },

      __receive: function (text) {
        var message;
        try {
          message = typeof text === 'string' ? JSON.parse(text) : text;
        } catch (error) {
          dispatch('message', text);
          return;
        }

        if (message && message.responseId !== undefined) {
          var entry = pending.get(message.responseId);
          if (!entry) {
            return;
          }
          pending.delete(message.responseId);
          if (message.error !== undefined && message.error !== null) {
            entry.reject(message.error);
          } else {
            entry.resolve(message.payload);
          }
          return;
        }

        if (message && message.event !== undefined) {
          dispatch(message.event, message.payload);
          return;
        }

        dispatch('message', message);
      }
    })
  });
})();
)js";

}  // namespace

const std::string& InitScript() {
  static const std::string script{kInitScript};
  return script;
}

std::string ReceiveScript(std::string_view message) {
  return "window.webframe && window.webframe.__receive(" + QuoteJson(message) + ");";
}

}  // namespace webframe::bridge
