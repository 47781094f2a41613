/**
 * TextForge — Browser UI and health routes
 * GET / serves a single self-contained page that talks to the JSON endpoints.
 */

#include "routes.h"

// ─── Embedded page ──────────────────────────────────────────────────────────

static const string INDEX_HTML = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="UTF-8" />
  <meta name="viewport" content="width=device-width, initial-scale=1" />
  <title>TextForge</title>
  <style>
    :root { --accent: #2563eb; --muted: #6b7280; --panel: #ffffff; }
    * { box-sizing: border-box; }
    body {
      font-family: system-ui, -apple-system, "Segoe UI", sans-serif;
      max-width: 1040px;
      margin: 32px auto;
      padding: 0 16px;
      background: #f3f4f6;
      color: #1f2937;
    }
    header { text-align: center; margin-bottom: 20px; }
    header p { color: var(--muted); margin-top: 4px; }
    .panel {
      background: var(--panel);
      border-radius: 12px;
      padding: 16px 20px;
      margin-bottom: 18px;
      box-shadow: 0 2px 10px rgba(0, 0, 0, 0.06);
    }
    textarea {
      width: 100%;
      min-height: 160px;
      padding: 10px;
      border: 1px solid #d1d5db;
      border-radius: 8px;
      font: inherit;
      font-size: 14px;
      resize: vertical;
    }
    .toolbar { display: flex; flex-wrap: wrap; align-items: center; gap: 8px; margin-top: 10px; }
    .toolbar select { padding: 6px 10px; border-radius: 8px; border: 1px solid #d1d5db; }
    button {
      border: 0;
      border-radius: 8px;
      padding: 8px 14px;
      font-size: 13px;
      cursor: pointer;
      background: #e5e7eb;
      color: #111827;
    }
    button.main { background: var(--accent); color: #fff; }
    button:disabled { opacity: 0.55; cursor: progress; }
    #status { min-height: 18px; margin-top: 8px; font-size: 12px; color: var(--muted); }
    .results { display: grid; grid-template-columns: repeat(2, minmax(0, 1fr)); gap: 16px; }
    @media (max-width: 760px) { .results { grid-template-columns: 1fr; } }
    .results h2 { font-size: 15px; margin: 0 0 8px; }
    pre {
      margin: 0;
      min-height: 40px;
      max-height: 280px;
      overflow-y: auto;
      padding: 12px;
      border-radius: 8px;
      background: #111827;
      color: #e5e7eb;
      font-size: 13px;
      white-space: pre-wrap;
      word-break: break-word;
    }
  </style>
</head>
<body>
  <header>
    <h1>TextForge</h1>
    <p>Summaries, keywords, tone rewrites, questions, titles and expansions for any text.</p>
  </header>

  <section class="panel">
    <label for="source"><strong>Your text</strong></label>
    <textarea id="source" placeholder="Paste or type text here..."></textarea>

    <div class="toolbar">
      <label for="tone">Tone</label>
      <select id="tone">
        <option value="neutral">Neutral</option>
        <option value="formal">Formal</option>
        <option value="informal">Informal</option>
        <option value="friendly">Friendly</option>
        <option value="professional">Professional</option>
        <option value="persuasive">Persuasive</option>
      </select>
    </div>

    <div class="toolbar">
      <button class="main" data-task="summarize">Summarize</button>
      <button data-task="keywords">Keywords</button>
      <button data-task="rewrite">Rewrite</button>
      <button data-task="questions">Questions</button>
      <button data-task="titles">Titles</button>
      <button data-task="expand">Expand</button>
    </div>

    <div id="status"></div>
  </section>

  <section class="results">
    <div class="panel"><h2>Summary</h2><pre id="out-summarize">-</pre></div>
    <div class="panel"><h2>Keywords</h2><pre id="out-keywords">-</pre></div>
    <div class="panel"><h2>Rewrite</h2><pre id="out-rewrite">-</pre></div>
    <div class="panel"><h2>Questions</h2><pre id="out-questions">-</pre></div>
    <div class="panel"><h2>Titles</h2><pre id="out-titles">-</pre></div>
    <div class="panel"><h2>Expand</h2><pre id="out-expand">-</pre></div>
  </section>

  <script>
    const source  = document.getElementById('source');
    const tone    = document.getElementById('tone');
    const status  = document.getElementById('status');
    const buttons = Array.from(document.querySelectorAll('button[data-task]'));

    const bullets = list => list.map(item => '- ' + item).join('\n');

    // How each endpoint's JSON is turned into display text.
    const render = {
      summarize: d => d.summary || '(no summary)',
      keywords:  d => Array.isArray(d.keywords) ? d.keywords.join(', ') : JSON.stringify(d, null, 2),
      rewrite:   d => d.text || '(no rewrite)',
      questions: d => Array.isArray(d.questions) ? bullets(d.questions) : JSON.stringify(d, null, 2),
      titles:    d => Array.isArray(d.titles) ? bullets(d.titles) : JSON.stringify(d, null, 2),
      expand:    d => d.text || '(no expansion)',
    };

    function busy(on, message) {
      buttons.forEach(b => { b.disabled = on; });
      status.textContent = message || '';
    }

    async function run(task) {
      const text = source.value.trim();
      if (!text) {
        alert('Please enter some text first.');
        return;
      }

      const body = { text };
      if (task === 'rewrite') body.tone = tone.value;

      busy(true, 'Calling /' + task + ' ...');
      try {
        const res = await fetch('/' + task, {
          method: 'POST',
          headers: { 'Content-Type': 'application/json' },
          body: JSON.stringify(body),
        });
        if (!res.ok) {
          throw new Error('HTTP ' + res.status + ': ' + await res.text());
        }
        const data = await res.json();
        document.getElementById('out-' + task).textContent = render[task](data);
        busy(false);
      } catch (err) {
        console.error(err);
        alert('Error: ' + err.message);
        busy(false, 'Error, see console.');
      }
    }

    buttons.forEach(b => b.addEventListener('click', () => run(b.dataset.task)));
  </script>
</body>
</html>
)HTML";

const string& index_html() {
    return INDEX_HTML;
}

// ─── Registration ───────────────────────────────────────────────────────────

void register_ui_routes(httplib::Server& svr) {
    // ── GET / — the page itself; anything else under / is a plain 404 ───────
    svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(index_html(), "text/html; charset=utf-8");
    });

    // ── /health — liveness probe, any method ────────────────────────────────
    route_all_methods(svr, "/health", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, {{"status", "ok"}});
    });
}
