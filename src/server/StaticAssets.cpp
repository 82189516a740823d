#include "server/StaticAssets.hpp"

namespace dropzone {

namespace {

const std::string INDEX_HTML = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>DropZone</title>
<link rel="icon" href="/favicon.svg" type="image/svg+xml">
<style>
  :root { color-scheme: light dark; --accent: #8b5cf6; }
  body { font-family: system-ui, sans-serif; max-width: 34rem; margin: 2rem auto; padding: 0 1rem; }
  h1 { color: var(--accent); }
  section { border: 1px solid #8884; border-radius: 12px; padding: 1rem; margin-bottom: 1.5rem; }
  #drop { border: 2px dashed var(--accent); border-radius: 12px; padding: 2rem; text-align: center; cursor: pointer; }
  #drop.over { background: #8b5cf622; }
  textarea { width: 100%; min-height: 6rem; box-sizing: border-box; font: inherit; }
  button { background: var(--accent); color: white; border: 0; border-radius: 8px; padding: .6rem 1.2rem; font: inherit; margin-top: .5rem; }
  progress { width: 100%; }
  .status { min-height: 1.4em; margin-top: .5rem; }
  .ok { color: #16a34a; } .err { color: #dc2626; }
</style>
</head>
<body>
<h1>DropZone</h1>

<section>
  <h2>Files</h2>
  <div id="drop">Drop files here or tap to choose</div>
  <input id="files" type="file" name="file" multiple hidden>
  <progress id="progress" value="0" max="100" hidden></progress>
  <div id="fileStatus" class="status"></div>
</section>

<section>
  <h2>Message</h2>
  <form id="messageForm">
    <textarea name="message" placeholder="Type a message for the host"></textarea>
    <button type="submit">Send</button>
  </form>
  <div id="messageStatus" class="status"></div>
</section>

<script>
const drop = document.getElementById('drop');
const input = document.getElementById('files');
const progress = document.getElementById('progress');
const fileStatus = document.getElementById('fileStatus');

function show(el, text, ok) {
  el.textContent = text;
  el.className = 'status ' + (ok ? 'ok' : 'err');
}

function upload(files) {
  if (!files.length) return;
  const form = new FormData();
  for (const f of files) form.append('file', f, f.name);

  const xhr = new XMLHttpRequest();
  xhr.open('POST', '/upload');
  progress.hidden = false;
  progress.value = 0;
  xhr.upload.onprogress = e => { if (e.lengthComputable) progress.value = 100 * e.loaded / e.total; };
  xhr.onload = () => {
    progress.hidden = true;
    if (xhr.status === 200) {
      const n = JSON.parse(xhr.responseText).files.length;
      show(fileStatus, 'Sent ' + n + ' file' + (n === 1 ? '' : 's'), true);
    } else {
      let msg = 'Upload failed (' + xhr.status + ')';
      try { msg += ': ' + JSON.parse(xhr.responseText).message; } catch (e) {}
      show(fileStatus, msg, false);
    }
  };
  xhr.onerror = () => { progress.hidden = true; show(fileStatus, 'Connection lost', false); };
  xhr.send(form);
}

drop.onclick = () => input.click();
input.onchange = () => { upload(input.files); input.value = ''; };
drop.ondragover = e => { e.preventDefault(); drop.classList.add('over'); };
drop.ondragleave = () => drop.classList.remove('over');
drop.ondrop = e => { e.preventDefault(); drop.classList.remove('over'); upload(e.dataTransfer.files); };

document.getElementById('messageForm').onsubmit = async e => {
  e.preventDefault();
  const status = document.getElementById('messageStatus');
  try {
    const res = await fetch('/message', { method: 'POST', body: new FormData(e.target) });
    if (res.ok) { show(status, 'Sent', true); e.target.reset(); }
    else show(status, 'Failed (' + res.status + ')', false);
  } catch (err) {
    show(status, 'Connection lost', false);
  }
};
</script>
</body>
</html>
)HTML";

const std::string FAVICON_SVG = R"SVG(<svg xmlns="http://www.w3.org/2000/svg" viewBox="0 0 64 64">
<rect width="64" height="64" rx="14" fill="#8b5cf6"/>
<path d="M32 14v26m0 0-10-10m10 10 10-10M18 48h28" stroke="#fff" stroke-width="6" fill="none" stroke-linecap="round" stroke-linejoin="round"/>
</svg>
)SVG";

} // namespace

std::optional<StaticAsset> StaticAssets::find(const std::string& path) {
    if (path == "/" || path == "/index.html") {
        return StaticAsset{"text/html; charset=utf-8", &INDEX_HTML};
    }
    if (path == "/favicon.svg") {
        return StaticAsset{"image/svg+xml", &FAVICON_SVG};
    }
    return std::nullopt;
}

} // namespace dropzone
