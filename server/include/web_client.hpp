#pragma once

#include "endpoint_resolver.hpp"

#include <string>

namespace pcdrop {

// Phone-side page: upload form with progress, browsable downloads with
// multi-select zip, and the list of files already received.
// %MODE% is replaced with the active transfer mode.
const char WEB_CLIENT_TEMPLATE[] = R"rawliteral(
<!DOCTYPE html>
<html>
<head>
  <meta charset="UTF-8">
  <meta name="viewport" content="width=device-width, initial-scale=1">
  <title>PC Drop</title>
  <style>
    * {
      box-sizing: border-box;
    }
    body {
      font-family: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, sans-serif;
      margin: 0;
      padding: 16px;
      background: #f5f5f5;
      color: #333;
      font-size: 17px;
      line-height: 1.5;
    }
    h1 {
      font-size: 22px;
      margin: 0 0 4px 0;
    }
    .mode {
      color: #777;
      font-size: 14px;
      margin-bottom: 16px;
    }
    .card {
      background: #fff;
      border-radius: 10px;
      padding: 14px;
      margin-bottom: 16px;
      box-shadow: 0 1px 3px rgba(0, 0, 0, 0.1);
    }
    .card h2 {
      font-size: 18px;
      margin: 0 0 10px 0;
    }
    button, .button {
      background: #1976d2;
      color: #fff;
      border: none;
      border-radius: 6px;
      padding: 8px 14px;
      font-size: 15px;
      margin: 4px 4px 4px 0;
      cursor: pointer;
    }
    button:disabled {
      background: #aaa;
    }
    .crumbs a {
      color: #1976d2;
      text-decoration: none;
    }
    ul.files {
      list-style: none;
      padding: 0;
      margin: 8px 0;
    }
    ul.files li {
      display: flex;
      align-items: center;
      padding: 6px 0;
      border-bottom: 1px solid #eee;
    }
    ul.files li .name {
      flex: 1;
      word-break: break-all;
      margin-left: 8px;
    }
    ul.files li .size {
      color: #888;
      font-size: 13px;
      margin-left: 8px;
      white-space: nowrap;
    }
    .dir {
      font-weight: bold;
      color: #1976d2;
      cursor: pointer;
    }
    progress {
      width: 100%;
      height: 18px;
    }
    .status {
      font-size: 14px;
      margin-top: 6px;
    }
    .error {
      color: #c62828;
    }
    .ok {
      color: #2e7d32;
    }
  </style>
</head>
<body>
  <h1>PC Drop</h1>
  <div class="mode">Connected over %MODE%</div>

  <div class="card">
    <h2>Send to PC</h2>
    <input type="file" id="picker" multiple>
    <button id="send">Upload</button>
    <progress id="progress" value="0" max="100"></progress>
    <div class="status" id="uploadStatus"></div>
  </div>

  <div class="card">
    <h2>Get from PC</h2>
    <div class="crumbs" id="crumbs"></div>
    <ul class="files" id="downloads"></ul>
    <button id="getSelected" disabled>Download selected</button>
    <button id="getFolder">Download this folder</button>
  </div>

  <div class="card">
    <h2>Received on PC</h2>
    <ul class="files" id="uploads"></ul>
  </div>

  <script>
    var current = 'downloads';

    function formatSize(n) {
      if (n < 1024) return n + ' B';
      var units = ['KB', 'MB', 'GB', 'TB'];
      var i = -1;
      do {
        n /= 1024;
        i++;
      } while (n >= 1024 && i < units.length - 1);
      return n.toFixed(1) + ' ' + units[i];
    }

    function encodePath(p) {
      return p.split('/').map(encodeURIComponent).join('/');
    }

    function listDir(path) {
      return fetch('/api/files?path=' + encodeURIComponent(path)).then(function(r) {
        if (!r.ok) throw new Error('HTTP ' + r.status);
        return r.json();
      });
    }

    function renderCrumbs() {
      var crumbs = document.getElementById('crumbs');
      crumbs.innerHTML = '';
      var parts = current.split('/');
      for (var i = 0; i < parts.length; i++) {
        (function(upTo) {
          var a = document.createElement('a');
          a.href = '#';
          a.textContent = parts[upTo];
          a.onclick = function(e) {
            e.preventDefault();
            openDir(parts.slice(0, upTo + 1).join('/'));
          };
          crumbs.appendChild(a);
          if (upTo < parts.length - 1) crumbs.appendChild(document.createTextNode(' / '));
        })(i);
      }
    }

    function updateSelection() {
      var checked = document.querySelectorAll('#downloads input:checked');
      document.getElementById('getSelected').disabled = checked.length === 0;
    }

    function openDir(path) {
      current = path;
      renderCrumbs();
      var list = document.getElementById('downloads');
      list.innerHTML = '<li>Loading...</li>';
      listDir(path).then(function(entries) {
        list.innerHTML = '';
        if (entries.length === 0) list.innerHTML = '<li>Empty folder</li>';
        entries.forEach(function(entry) {
          var li = document.createElement('li');
          var box = document.createElement('input');
          box.type = 'checkbox';
          box.value = entry.virtualPath;
          box.onchange = updateSelection;
          li.appendChild(box);
          var name = document.createElement('span');
          name.className = 'name';
          name.textContent = entry.name;
          if (entry.isDirectory) {
            name.className += ' dir';
            name.onclick = function() { openDir(entry.virtualPath); };
          } else {
            var link = document.createElement('a');
            link.href = '/download/' + encodePath(entry.virtualPath);
            link.textContent = entry.name;
            name.textContent = '';
            name.appendChild(link);
            var size = document.createElement('span');
            size.className = 'size';
            size.textContent = formatSize(entry.size);
            li.appendChild(name);
            li.appendChild(size);
            list.appendChild(li);
            return;
          }
          li.appendChild(name);
          list.appendChild(li);
        });
        updateSelection();
      }).catch(function(err) {
        list.innerHTML = '<li class="error">Could not load folder: ' + err.message + '</li>';
      });
    }

    function refreshUploads() {
      var list = document.getElementById('uploads');
      listDir('uploads').then(function(entries) {
        list.innerHTML = '';
        if (entries.length === 0) list.innerHTML = '<li>Nothing received yet</li>';
        entries.forEach(function(entry) {
          var li = document.createElement('li');
          var name = document.createElement('span');
          name.className = 'name';
          name.textContent = entry.name + (entry.isDirectory ? '/' : '');
          li.appendChild(name);
          if (!entry.isDirectory) {
            var size = document.createElement('span');
            size.className = 'size';
            size.textContent = formatSize(entry.size);
            li.appendChild(size);
          }
          list.appendChild(li);
        });
      }).catch(function() {
        list.innerHTML = '<li class="error">Could not load received files</li>';
      });
    }

    document.getElementById('getSelected').onclick = function() {
      var checked = document.querySelectorAll('#downloads input:checked');
      var query = [];
      for (var i = 0; i < checked.length; i++) {
        query.push('paths=' + encodeURIComponent(checked[i].value));
      }
      window.location.href = '/download-selected?' + query.join('&');
    };

    document.getElementById('getFolder').onclick = function() {
      window.location.href = '/download-folder/' + encodePath(current);
    };

    document.getElementById('send').onclick = function() {
      var files = document.getElementById('picker').files;
      var status = document.getElementById('uploadStatus');
      var progress = document.getElementById('progress');
      if (files.length === 0) {
        status.className = 'status error';
        status.textContent = 'Pick at least one file';
        return;
      }
      var form = new FormData();
      for (var i = 0; i < files.length; i++) form.append('files', files[i], files[i].name);

      var xhr = new XMLHttpRequest();
      xhr.open('POST', '/upload');
      xhr.upload.onprogress = function(e) {
        if (e.lengthComputable) progress.value = Math.round(e.loaded * 100 / e.total);
      };
      xhr.onload = function() {
        var body = {};
        try { body = JSON.parse(xhr.responseText); } catch (e) {}
        if (xhr.status === 200) {
          status.className = body.failed > 0 ? 'status error' : 'status ok';
          status.textContent = body.succeeded + ' uploaded, ' + body.failed + ' failed';
        } else {
          status.className = 'status error';
          status.textContent = body.message || ('Upload failed (HTTP ' + xhr.status + ')');
        }
        refreshUploads();
      };
      xhr.onerror = function() {
        status.className = 'status error';
        status.textContent = 'Connection lost during upload';
      };
      progress.value = 0;
      status.className = 'status';
      status.textContent = 'Uploading...';
      xhr.send(form);
    };

    openDir('downloads');
    refreshUploads();
  </script>
</body>
</html>
)rawliteral";

// page with the mode placeholder filled in
std::string render_web_client(const TransferMode &mode);

}  // namespace pcdrop
